#ifndef wordcrank_charsets_hpp
#define wordcrank_charsets_hpp

#include <optional>
#include <string>

namespace wordcrank {
/// The lowercase ASCII letters, in order.  This is also the default charset
/// for length-range generation.
std::string const& lowercase_characters();

/// The decimal digits, in order.
std::string const& digit_characters();

/// Punctuation used by the '^' pattern class.
std::string const& symbol_characters();

/// Return true if c names a character class in a pattern ('@', '%' or '^').
bool is_class_symbol(char c);

/// If c is a class symbol, return the charset it stands for.  Otherwise c is a
/// literal and nothing is returned.
std::optional<std::string> class_charset(char c);
} // namespace wordcrank

#endif // include guard
