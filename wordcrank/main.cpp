#include "Console.hpp"
#include "cli.hpp"
#include "interrupt.hpp"
#include "run_generation.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) try {
    using namespace wordcrank;
    auto const command =
        parse_command_line(std::vector<std::string>{argv, argv + argc});
    if (command.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    Console const console = standard_console();
    for (auto const& warning : command.warnings) {
        console.err << "[!] Warning: " << warning << std::endl;
    }

    InterruptFlag interrupt;
    auto const    result = run_generation(
        command.config, console, [&interrupt] { return interrupt.requested(); });
    return exit_code(result.outcome);
} catch (std::exception const& exe) {
    std::cerr << argv[0] << ": " << exe.what() << std::endl;
    return 1;
}
