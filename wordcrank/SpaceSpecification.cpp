#include "SpaceSpecification.hpp"

#include "charsets.hpp"

#include <boost/locale/utf.hpp>

#include <set>

namespace wordcrank {
namespace {
void validate_charset(std::string const& charset) {
    if (charset.empty()) {
        throw EmptyCharset{};
    }
    std::set<Symbol> seen;
    for (auto& symbol : split_symbols(charset)) {
        if (!seen.insert(symbol).second) {
            throw DuplicateSymbol{symbol};
        }
    }
}

struct Validate {
    void operator()(std::monostate) const {
        throw NoModeSelected{};
    }

    void operator()(RangeCombinations const& r) const {
        if (r.minLength > r.maxLength) {
            throw InvalidLengthRange{r.minLength, r.maxLength};
        }
        validate_charset(r.charset);
    }

    void operator()(Pattern const& p) const {
        for (auto const& token : p.tokens) {
            validate_charset(token.choices);
        }
    }

    void operator()(Permutations const& p) const {
        // repeats are allowed; only the encoding is checked
        split_symbols(p.symbols);
    }
};

struct TotalSize {
    BigInt operator()(std::monostate) const {
        throw NoModeSelected{};
    }

    BigInt operator()(RangeCombinations const& r) const {
        size_t const radix = split_symbols(r.charset).size();
        BigInt       out   = 0;
        for (size_t length = r.minLength; length <= r.maxLength; ++length) {
            out += power(radix, length);
            if (length == r.maxLength) {
                // maxLength may be the largest size_t
                break;
            }
        }
        return out;
    }

    BigInt operator()(Pattern const& p) const {
        BigInt out = 1;
        for (auto const& token : p.tokens) {
            out *= static_cast<unsigned long>(
                split_symbols(token.choices).size());
        }
        return out;
    }

    BigInt operator()(Permutations const& p) const {
        return factorial(split_symbols(p.symbols).size());
    }
};
} // namespace

RangeCombinations range_combinations(std::string  charset,
                                     size_t const minLength,
                                     size_t const maxLength) {
    RangeCombinations out{std::move(charset), minLength, maxLength};
    Validate{}(out);
    return out;
}

Pattern pattern(std::string_view const text) {
    Pattern out;
    for (auto& symbol : split_symbols(text)) {
        auto choices = symbol.size() == 1 ? class_charset(symbol[0])
                                          : std::nullopt;
        if (!choices) {
            choices = symbol;
        }
        out.tokens.push_back({std::move(symbol), std::move(*choices)});
    }
    return out;
}

Permutations permutations(std::string symbols) {
    Permutations out{std::move(symbols)};
    Validate{}(out);
    return out;
}

std::vector<Symbol> split_symbols(std::string_view const text) {
    using Traits = boost::locale::utf::utf_traits<char>;

    std::vector<Symbol> out;
    auto                iter = text.begin();
    while (iter != text.end()) {
        auto const start = iter;
        auto const code  = Traits::decode(iter, text.end());
        if (code == boost::locale::utf::illegal ||
            code == boost::locale::utf::incomplete) {
            throw InvalidEncoding{size_t(start - text.begin())};
        }
        out.emplace_back(start, iter);
    }
    return out;
}

void validate(SpaceSpecification const& space) {
    std::visit(Validate{}, space);
}

BigInt total_size(SpaceSpecification const& space) {
    validate(space);
    return std::visit(TotalSize{}, space);
}

BigInt factorial(size_t const n) {
    BigInt out;
    mpz_fac_ui(out.get_mpz_t(), n);
    return out;
}

BigInt power(size_t const base, size_t const exponent) {
    BigInt out;
    mpz_ui_pow_ui(out.get_mpz_t(), base, exponent);
    return out;
}

std::string with_commas(BigInt const& n) {
    std::string const digits = n.get_str();
    size_t const      sign   = (!digits.empty() && digits[0] == '-') ? 1 : 0;
    std::string       out;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > sign && (digits.size() - i) % 3 == 0) {
            out += ',';
        }
        out += digits[i];
    }
    return out;
}

NoModeSelected::NoModeSelected()
    : InvalidSpecification{"no generation mode selected"} {}

InvalidLengthRange::InvalidLengthRange(size_t const minLength,
                                       size_t const maxLength)
    : InvalidSpecification{"minimum length " + std::to_string(minLength) +
                           " exceeds maximum length " +
                           std::to_string(maxLength)} {}

EmptyCharset::EmptyCharset()
    : InvalidSpecification{"character set is empty"} {}

DuplicateSymbol::DuplicateSymbol(Symbol const& symbol)
    : InvalidSpecification{"character set repeats '" + symbol + "'"} {}

InvalidEncoding::InvalidEncoding(size_t const offset)
    : InvalidSpecification{"invalid UTF-8 at byte " + std::to_string(offset)} {}
} // namespace wordcrank
