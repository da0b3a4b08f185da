#ifndef wordcrank_SpaceSpecification_hpp
#define wordcrank_SpaceSpecification_hpp

#include <gmpxx.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wordcrank {
// Sizes, offsets and counts.  Realistic spaces overflow 64 bits (95 symbols at
// length 20 already does), so all of them are arbitrary precision.
using BigInt = mpz_class;

// One symbol of a charset, pattern or permutation: the UTF-8 encoding of a
// single code point.
using Symbol = std::string;

// Every word of length minLength through maxLength over charset.  Text fields
// hold UTF-8 and are counted in code points, not bytes.
struct RangeCombinations {
    std::string charset;
    size_t      minLength = 0;
    size_t      maxLength = 0;
    bool        operator==(RangeCombinations const&) const = default;
};

// One position of a pattern.  symbol is the pattern character and choices the
// characters that may appear at that position (just symbol for a literal).
struct PatternToken {
    Symbol      symbol;
    std::string choices;
    bool        operator==(PatternToken const&) const = default;
};

struct Pattern {
    std::vector<PatternToken> tokens;
    bool                      operator==(Pattern const&) const = default;
};

// Every arrangement of symbols.  Repeated symbols are not collapsed, so
// "aab" has 3! arrangements, some of them identical.
struct Permutations {
    std::string symbols;
    bool        operator==(Permutations const&) const = default;
};

// monostate means no generation mode was selected; it never validates.
using SpaceSpecification =
    std::variant<std::monostate, RangeCombinations, Pattern, Permutations>;

/// Construct and validate a RangeCombinations.
RangeCombinations range_combinations(std::string charset,
                                     size_t      minLength,
                                     size_t      maxLength);

/// Construct a Pattern from its text.  Class symbols ('@', '%', '^') resolve
/// to their charset, every other code point is a literal.  Throws
/// InvalidEncoding if text is not UTF-8.
Pattern pattern(std::string_view text);

/// Throws InvalidEncoding if symbols is not UTF-8.
Permutations permutations(std::string symbols);

/// Split text into its code points.  Throws InvalidEncoding if text is not
/// well-formed UTF-8.
std::vector<Symbol> split_symbols(std::string_view text);

/// Throw an InvalidSpecification if space cannot be enumerated.
void validate(SpaceSpecification const& space);

/// The exact number of words in space.
BigInt total_size(SpaceSpecification const& space);

/// n!
BigInt factorial(size_t n);

/// base^exponent
BigInt power(size_t base, size_t exponent);

/// Format n in decimal with a comma between each group of three digits.
std::string with_commas(BigInt const& n);

struct InvalidSpecification : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct NoModeSelected : InvalidSpecification {
    NoModeSelected();
};

struct InvalidLengthRange : InvalidSpecification {
    InvalidLengthRange(size_t minLength, size_t maxLength);
};

struct EmptyCharset : InvalidSpecification {
    EmptyCharset();
};

struct DuplicateSymbol : InvalidSpecification {
    DuplicateSymbol(Symbol const&);
};

struct InvalidEncoding : InvalidSpecification {
    explicit InvalidEncoding(size_t offset);
};
} // namespace wordcrank

#endif // include guard
