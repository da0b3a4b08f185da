#include "Enumerator.hpp"

#include <algorithm>
#include <numeric>

namespace wordcrank {
namespace {
// index written in the mixed-radix system given by radices, most significant
// position first.  index must be less than the product of radices.
std::vector<size_t> to_mixed_radix(BigInt                     index,
                                   std::vector<size_t> const& radices) {
    std::vector<size_t> out(radices.size());
    for (size_t i = radices.size(); i-- > 0;) {
        out[i] = mpz_fdiv_q_ui(index.get_mpz_t(), index.get_mpz_t(), radices[i]);
    }
    return out;
}

// index decoded through the factorial number system: the index-th permutation
// of 0..n-1 in lexicographic order.  index must be less than n!.
std::vector<size_t> to_permutation(BigInt index, size_t const n) {
    std::vector<size_t> unused(n);
    std::iota(unused.begin(), unused.end(), size_t{0});

    std::vector<size_t> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        BigInt const place = factorial(n - 1 - i);
        BigInt const which = index / place;
        index %= place;
        auto const iter = unused.begin() + which.get_ui();
        out.push_back(*iter);
        unused.erase(iter);
    }
    return out;
}

std::vector<std::vector<Symbol>> alphabets_of(SpaceSpecification const& space) {
    std::vector<std::vector<Symbol>> out;
    if (auto const* r = std::get_if<RangeCombinations>(&space)) {
        out.push_back(split_symbols(r->charset));
    } else if (auto const* p = std::get_if<Pattern>(&space)) {
        for (auto const& token : p->tokens) {
            out.push_back(split_symbols(token.choices));
        }
    } else if (auto const* p = std::get_if<Permutations>(&space)) {
        out.push_back(split_symbols(p->symbols));
    }
    return out;
}
} // namespace

Enumerator::Enumerator(SpaceSpecification space)
    : space_{std::move(space)}
    , size_{total_size(space_)}
    , position_{0}
    , alphabets_{alphabets_of(space_)} {
    seek(0);
}

bool Enumerator::done() const {
    return position_ >= size_;
}

std::string Enumerator::next() {
    if (done()) {
        throw std::out_of_range{"enumeration is exhausted"};
    }
    std::string out = render();
    ++position_;
    if (!done()) {
        increment();
    }
    return out;
}

void Enumerator::skip_ahead(BigInt const& n) {
    if (sgn(n) < 0) {
        throw std::invalid_argument{"cannot skip a negative number of words"};
    }
    if (sgn(n) > 0) {
        seek(position_ + n);
    }
}

void Enumerator::seek(BigInt const& index) {
    radices_.clear();
    digits_.clear();
    if (index >= size_) {
        position_ = size_;
        return;
    }
    position_ = index;

    if (auto const* r = std::get_if<RangeCombinations>(&space_)) {
        // find the block of words with the length index falls in
        size_t const radix  = alphabets_.front().size();
        BigInt       offset = index;
        size_t       length = r->minLength;
        for (;; ++length) {
            BigInt const block = power(radix, length);
            if (offset < block) {
                break;
            }
            offset -= block;
        }
        radices_.assign(length, radix);
        digits_ = to_mixed_radix(offset, radices_);
    } else if (std::holds_alternative<Pattern>(space_)) {
        for (auto const& alphabet : alphabets_) {
            radices_.push_back(alphabet.size());
        }
        digits_ = to_mixed_radix(index, radices_);
    } else if (std::holds_alternative<Permutations>(space_)) {
        digits_ = to_permutation(index, alphabets_.front().size());
    }
}

void Enumerator::increment() {
    if (std::holds_alternative<Permutations>(space_)) {
        std::ranges::next_permutation(digits_);
        return;
    }

    for (size_t i = digits_.size(); i-- > 0;) {
        if (++digits_[i] < radices_[i]) {
            return;
        }
        digits_[i] = 0;
    }

    // every position rolled over.  A pattern never gets here before it is
    // done, so this is the first word of the next length.
    radices_.assign(digits_.size() + 1, alphabets_.front().size());
    digits_.assign(digits_.size() + 1, 0);
}

std::string Enumerator::render() const {
    bool const  perPosition = std::holds_alternative<Pattern>(space_);
    std::string out;
    for (size_t i = 0; i < digits_.size(); ++i) {
        out += alphabets_[perPosition ? i : 0][digits_[i]];
    }
    return out;
}

std::string word_at(SpaceSpecification const& space, BigInt const& index) {
    Enumerator enumerator{space};
    if (sgn(index) < 0 || index >= enumerator.size()) {
        throw std::out_of_range{"index " + index.get_str() +
                                " is outside a space of " +
                                enumerator.size().get_str() + " words"};
    }
    enumerator.skip_ahead(index);
    return enumerator.next();
}
} // namespace wordcrank
