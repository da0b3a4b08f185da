#include "Console.hpp"

#include <iostream>

namespace wordcrank {
Console standard_console() {
    return {std::cout, std::cerr};
}
} // namespace wordcrank
