#ifndef wordcrank_Enumerator_hpp
#define wordcrank_Enumerator_hpp

#include "SpaceSpecification.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace wordcrank {
/// Produces the words of a SpaceSpecification, one per index, in a fixed
/// order:
///
/// RangeCombinations: shorter words first.  Within a length the word is a
/// mixed-radix counter over the charset with the rightmost position
/// incrementing fastest, so "01" at lengths 1-2 gives 0 1 00 01 10 11.
///
/// Pattern: the same rightmost-fastest counter with each position's radix
/// taken from its token.
///
/// Permutations: positions are filled left to right, each choosing among the
/// input positions not yet used in increasing order.  This is lexicographic
/// order on the position indices, which is lexicographic order on the words
/// only when the input symbols are sorted.
///
/// Any index can be reached directly (see skip_ahead) without producing the
/// words before it.
class Enumerator {
  public:
    explicit Enumerator(SpaceSpecification space);

    /// true once all size() words have been produced
    bool done() const;

    /// Return the word at position() and move to the next one.  Throws
    /// std::out_of_range if done().
    std::string next();

    /// Move past the next n words without producing them.  Moving past the
    /// end leaves the enumerator done().
    void skip_ahead(BigInt const& n);

    /// Number of words produced or skipped so far.
    BigInt const& position() const {
        return position_;
    }

    BigInt const& size() const {
        return size_;
    }

  private:
    void        seek(BigInt const& index);
    void        increment();
    std::string render() const;

    SpaceSpecification space_;
    BigInt             size_;
    BigInt             position_;

    // the symbols each position draws from, decoded once.  A pattern has one
    // alphabet per token; the other modes share a single alphabet.
    std::vector<std::vector<Symbol>> alphabets_;

    // the radices of each position of the current word.  For permutations
    // this is unused and digits_ holds the order of the input positions.
    std::vector<size_t> radices_;
    std::vector<size_t> digits_;
};

/// The word at index of space.  Throws std::out_of_range if index is not
/// less than total_size(space).
std::string word_at(SpaceSpecification const& space, BigInt const& index);
} // namespace wordcrank

#endif // include guard
