#ifndef wordcrank_cli_hpp
#define wordcrank_cli_hpp

#include "run_generation.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wordcrank {
struct Command {
    RunConfig config;

    // arguments that were given but have no effect
    std::vector<std::string> warnings;

    // --help; config is meaningless
    bool help = false;
};

/// Parse a command line (args[0] is the program name):
///
///   min_len max_len [charset] [-t pattern] [-x symbols] [-p prefix]
///   [-s suffix] [-o output] [-l limit] [--resume]
///
/// --permutations takes precedence over --pattern, which takes precedence
/// over the charset and lengths.  min_len and max_len are required unless
/// --permutations is given.  Throws UsageError or InvalidSpecification if the
/// arguments do not describe a run.
Command parse_command_line(std::vector<std::string> const& args);

std::string usage(std::string_view program);

struct UsageError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};
} // namespace wordcrank

#endif // include guard
