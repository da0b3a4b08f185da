#include "charsets.hpp"

#include <unordered_map>

namespace wordcrank {
namespace {
std::unordered_map<char, std::string> const& classes() {
    static std::unordered_map<char, std::string> const m{
        {'@', lowercase_characters()},
        {'%', digit_characters()},
        {'^', symbol_characters()},
    };
    return m;
}
} // namespace

std::string const& lowercase_characters() {
    static std::string const s{"abcdefghijklmnopqrstuvwxyz"};
    return s;
}

std::string const& digit_characters() {
    static std::string const s{"0123456789"};
    return s;
}

std::string const& symbol_characters() {
    static std::string const s{R"(!@#$%^&*()_+-=[]{}|;':",./<>?`~)"};
    return s;
}

bool is_class_symbol(char const c) {
    return classes().contains(c);
}

std::optional<std::string> class_charset(char const c) {
    if (auto const iter = classes().find(c); iter != classes().end()) {
        return iter->second;
    }
    return {};
}
} // namespace wordcrank
