#ifndef wordcrank_Console_hpp
#define wordcrank_Console_hpp

#include <iosfwd>

namespace wordcrank {
// Where user-facing messages go.  out gets the run's story ("[*]" and "[+]"
// lines), err gets warnings, errors and progress.
struct Console {
    std::ostream& out;
    std::ostream& err;
};

// std::cout and std::cerr
Console standard_console();
} // namespace wordcrank

#endif // include guard
