#include "SessionStore.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace wordcrank {
namespace {
std::string trim(std::string const& s) {
    auto const isSpace = [](unsigned char const c) {
        return std::isspace(c) != 0;
    };
    auto const first = std::ranges::find_if_not(s, isSpace);
    auto const last  = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return first < last ? std::string{first, last} : std::string{};
}

BigInt read_count(std::filesystem::path const& path) {
    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream) {
        throw SessionReadError{"cannot read " + path.string()};
    }
    std::string const text = trim(std::string{
        std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}});
    if (stream.bad()) {
        throw SessionReadError{"cannot read " + path.string()};
    }
    if (text.empty() || !std::ranges::all_of(text, [](unsigned char const c) {
            return std::isdigit(c) != 0;
        })) {
        throw SessionReadError{"invalid count '" + text + "' in " +
                               path.string()};
    }
    return BigInt{text, 10};
}
} // namespace

SessionStore::SessionStore(std::filesystem::path const& outputTarget)
    : path_{session_path(outputTarget)} {}

BigInt SessionStore::read_resume_offset(std::ostream& warnings) const {
    std::error_code ec;
    if (!exists(path_, ec)) {
        return 0;
    }
    try {
        return read_count(path_);
    } catch (SessionReadError const& e) {
        warnings << "[!] Warning: Could not read session file: " << e.what()
                 << ". Starting from the beginning." << std::endl;
        return 0;
    }
}

void SessionStore::persist(BigInt const& count) const {
    // write a sibling and rename it over the record so that the record is
    // either the old count or the new one
    std::filesystem::path temporary{path_};
    temporary += ".tmp";
    {
        std::ofstream stream{temporary,
                             std::ios::out | std::ios::trunc | std::ios::binary};
        stream << count.get_str();
        stream.close();
        if (!stream) {
            throw SessionWriteError{"cannot write " + temporary.string()};
        }
    }
    std::error_code ec;
    std::filesystem::rename(temporary, path_, ec);
    if (ec) {
        throw SessionWriteError{"cannot save progress to " + path_.string() +
                                ": " + ec.message()};
    }
}

void SessionStore::clear() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        throw SessionWriteError{"cannot remove " + path_.string() + ": " +
                                ec.message()};
    }
}

std::filesystem::path session_path(std::filesystem::path const& outputTarget) {
    std::filesystem::path out{outputTarget};
    out += SessionStore::suffix;
    return out;
}
} // namespace wordcrank
