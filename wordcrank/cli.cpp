#include "cli.hpp"

#include "charsets.hpp"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace wordcrank {
namespace {
enum LongOnly : int {
    ResumeOption = 256,
};

option const longOptions[]{
    {"pattern", required_argument, nullptr, 't'},
    {"permutations", required_argument, nullptr, 'x'},
    {"prefix", required_argument, nullptr, 'p'},
    {"suffix", required_argument, nullptr, 's'},
    {"output", required_argument, nullptr, 'o'},
    {"limit", required_argument, nullptr, 'l'},
    {"resume", no_argument, nullptr, ResumeOption},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

bool is_decimal(std::string const& s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char const c) {
        return std::isdigit(c) != 0;
    });
}

size_t parse_length(std::string const& text, std::string const& name) {
    size_t     out  = 0;
    auto const last = text.data() + text.size();
    if (is_decimal(text)) {
        if (auto const [end, ec] = std::from_chars(text.data(), last, out);
            ec == std::errc{} && end == last) {
            return out;
        }
    }
    throw UsageError{"argument " + name + ": invalid length '" + text + "'"};
}

BigInt parse_limit(std::string const& text) {
    if (!is_decimal(text)) {
        throw UsageError{"argument -l/--limit: invalid count '" + text + "'"};
    }
    return BigInt{text, 10};
}

// the option getopt_long just rejected
std::string rejected_option(char* const* argv) {
    if (optopt != 0) {
        return std::string{"-"} + static_cast<char>(optopt);
    }
    return argv[optind - 1];
}
} // namespace

Command parse_command_line(std::vector<std::string> const& args) {
    if (args.empty()) {
        throw UsageError{"missing program name"};
    }

    // getopt_long reorders its argv so hand it a private copy
    std::vector<std::string> storage{args};
    std::vector<char*>       argv;
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    int const argc = static_cast<int>(storage.size());

    Command                    out;
    std::string                patternText;
    std::string                permutationText;
    std::optional<std::string> charset;

    // 0 (rather than 1) makes glibc reset all of its parsing state
    optind = 0;
    opterr = 0;
    while (true) {
        int const c =
            getopt_long(argc, argv.data(), ":t:x:p:s:o:l:h", longOptions, nullptr);
        if (c == -1) {
            break;
        }
        switch (c) {
        case 't':
            patternText = optarg;
            break;
        case 'x':
            permutationText = optarg;
            break;
        case 'p':
            out.config.prefix = optarg;
            break;
        case 's':
            out.config.suffix = optarg;
            break;
        case 'o':
            out.config.output = optarg;
            break;
        case 'l':
            out.config.limit = parse_limit(optarg);
            break;
        case ResumeOption:
            out.config.resume = true;
            break;
        case 'h':
            out.help = true;
            return out;
        case ':':
            throw UsageError{"option " + rejected_option(argv.data()) +
                             " requires an argument"};
        default:
            throw UsageError{"unrecognized option " +
                             rejected_option(argv.data())};
        }
    }

    std::vector<std::string> const positional(argv.begin() + optind,
                                              argv.begin() + argc);
    if (positional.size() > 3) {
        std::string extra;
        for (size_t i = 3; i < positional.size(); ++i) {
            extra += (i > 3 ? " " : "") + positional[i];
        }
        throw UsageError{"unrecognized arguments: " + extra};
    }

    std::optional<size_t> minLength;
    std::optional<size_t> maxLength;
    if (positional.size() > 0) {
        minLength = parse_length(positional[0], "min_len");
    }
    if (positional.size() > 1) {
        maxLength = parse_length(positional[1], "max_len");
    }
    if (positional.size() > 2) {
        charset = positional[2];
    }

    // an empty --permutations or --pattern counts as not given
    bool const usePermutations = !permutationText.empty();
    bool const usePattern      = !patternText.empty();

    if (!usePermutations && !(minLength && maxLength)) {
        throw UsageError{"the following arguments are required: min_len, "
                         "max_len unless --permutations is used"};
    }
    if (minLength && maxLength && *minLength > *maxLength) {
        throw UsageError{"Minimum length cannot exceed maximum length."};
    }

    if (usePattern && charset && *charset != lowercase_characters()) {
        out.warnings.emplace_back(
            "'charset' argument is ignored when a 'pattern' is specified.");
    }
    if (usePermutations && (minLength || usePattern)) {
        out.warnings.emplace_back(
            "Length and pattern arguments are ignored for permutations.");
    }

    if (usePermutations) {
        out.config.space = permutations(permutationText);
    } else if (usePattern) {
        out.config.space = pattern(patternText);
    } else {
        out.config.space = range_combinations(
            charset.value_or(lowercase_characters()), *minLength, *maxLength);
    }
    return out;
}

std::string usage(std::string_view const program) {
    std::string const p{program};
    return "usage: " + p +
           " [min_len max_len [charset]] [-t PATTERN] [-x SYMBOLS]\n"
           "       [-p PREFIX] [-s SUFFIX] [-o OUTPUT] [-l LIMIT] [--resume]\n"
           "\n"
           "Write every word of a search space to a file, one per line.\n"
           "\n"
           "Generation modes:\n"
           "  min_len max_len     word lengths to generate\n"
           "  charset             characters to use (default a-z)\n"
           "  -t, --pattern       one position per character: @ is a-z, % is "
           "0-9,\n"
           "                      ^ is punctuation, anything else is itself.\n"
           "                      Overrides min_len/max_len/charset.\n"
           "  -x, --permutations  every arrangement of the given characters.\n"
           "                      Overrides everything above.\n"
           "\n"
           "Modifiers:\n"
           "  -p, --prefix        text before each word\n"
           "  -s, --suffix        text after each word\n"
           "\n"
           "Control and output:\n"
           "  -o, --output        output file (default wordlist.txt)\n"
           "  -l, --limit         stop after this many words\n"
           "      --resume        continue an interrupted run\n"
           "  -h, --help          show this message\n"
           "\n"
           "Examples:\n"
           "  " + p + " 4 5\n"
           "  " + p + " 4 4 0123456789 -p PIN -o pins.txt\n"
           "  " + p + " 8 8 -t @@@@^%\n"
           "  " + p + " -x pass123 -o perms.txt\n"
           "  " + p + " 8 8 0123456789abcdef -o biglist.txt --resume\n";
}
} // namespace wordcrank
