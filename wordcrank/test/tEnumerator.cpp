#include "../Enumerator.hpp"
#include "../charsets.hpp"
#include "RandomIndexes.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <ranges>
#include <set>

using namespace wordcrank;
using namespace wordcrank::test;
using testing::ElementsAre;
using testing::ElementsAreArray;

namespace {
std::vector<std::string> all_words(SpaceSpecification const& space) {
    Enumerator               e{space};
    std::vector<std::string> out;
    while (!e.done()) {
        out.push_back(e.next());
    }
    return out;
}

// nested loops, outermost loop on the leftmost position
void product(std::vector<std::string> const& alphabets,
             std::string&                    current,
             std::vector<std::string>&       out) {
    if (current.size() == alphabets.size()) {
        out.push_back(current);
        return;
    }
    for (auto const c : alphabets[current.size()]) {
        current.push_back(c);
        product(alphabets, current, out);
        current.pop_back();
    }
}

std::vector<std::string> expected_range(std::string const& charset,
                                        size_t const       minLength,
                                        size_t const       maxLength) {
    std::vector<std::string> out;
    for (size_t length = minLength; length <= maxLength; ++length) {
        std::string current;
        product(std::vector<std::string>(length, charset), current, out);
    }
    return out;
}

// choose the unused input positions in increasing order
std::vector<std::string> expected_permutations(std::string const& symbols) {
    std::vector<size_t> order(symbols.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::vector<std::string> out;
    do {
        std::string word;
        for (auto const i : order) {
            word += symbols[i];
        }
        out.push_back(word);
    } while (std::ranges::next_permutation(order).found);
    return out;
}

std::vector<SpaceSpecification> sample_spaces() {
    return {
        range_combinations("01", 1, 2),
        range_combinations("abc", 0, 4),
        range_combinations("x", 2, 5),
        range_combinations("0123456789", 3, 3),
        pattern("@%"),
        pattern("a^b%"),
        pattern(""),
        permutations("abcde"),
        permutations("bca"),
        permutations("aabb"),
        permutations(""),
        range_combinations("aé€", 1, 3),
        pattern("é@%"),
        permutations("éa€"),
    };
}
} // namespace

TEST(Enumerator, BinaryRange) {
    EXPECT_THAT(all_words(range_combinations("01", 1, 2)),
                ElementsAre("0", "1", "00", "01", "10", "11"));
}

TEST(Enumerator, RangeMatchesNestedLoops) {
    EXPECT_THAT(all_words(range_combinations("abc", 0, 4)),
                ElementsAreArray(expected_range("abc", 0, 4)));
    EXPECT_THAT(all_words(range_combinations("q7!", 2, 3)),
                ElementsAreArray(expected_range("q7!", 2, 3)));
}

TEST(Enumerator, ZeroLength) {
    EXPECT_THAT(all_words(range_combinations("ab", 0, 1)),
                ElementsAre("", "a", "b"));
}

TEST(Enumerator, Pattern) {
    auto const words = all_words(pattern("@%"));
    ASSERT_EQ(words.size(), 260u);
    EXPECT_EQ(words[0], "a0");
    EXPECT_EQ(words[1], "a1");
    EXPECT_EQ(words[2], "a2");
    EXPECT_EQ(words[10], "b0");
    EXPECT_EQ(words.back(), "z9");
}

TEST(Enumerator, PatternMatchesNestedLoops) {
    std::vector<std::string> expected;
    std::string              current;
    product({"x", digit_characters(), "-", lowercase_characters()},
            current,
            expected);
    EXPECT_THAT(all_words(pattern("x%-@")), ElementsAreArray(expected));
}

TEST(Enumerator, PatternOfLiterals) {
    EXPECT_THAT(all_words(pattern("abc")), ElementsAre("abc"));
}

TEST(Enumerator, Permutations) {
    EXPECT_THAT(all_words(permutations("ab")), ElementsAre("ab", "ba"));
    EXPECT_THAT(all_words(permutations("abc")),
                ElementsAre("abc", "acb", "bac", "bca", "cab", "cba"));
}

TEST(Enumerator, UnsortedPermutationsFollowInputPositions) {
    EXPECT_THAT(all_words(permutations("bac")),
                ElementsAre("bac", "bca", "abc", "acb", "cba", "cab"));
    EXPECT_THAT(all_words(permutations("dbeca")),
                ElementsAreArray(expected_permutations("dbeca")));
}

TEST(Enumerator, PermutationsRepeatDuplicates) {
    EXPECT_THAT(all_words(permutations("aab")),
                ElementsAre("aab", "aba", "aab", "aba", "baa", "baa"));
}

TEST(Enumerator, EmptyPermutation) {
    EXPECT_THAT(all_words(permutations("")), ElementsAre(""));
}

TEST(Enumerator, MultibyteSymbols) {
    EXPECT_THAT(all_words(range_combinations("aé", 1, 1)), ElementsAre("a", "é"));
    EXPECT_THAT(all_words(range_combinations("éè", 2, 2)),
                ElementsAre("éé", "éè", "èé", "èè"));
    EXPECT_THAT(all_words(permutations("é")), ElementsAre("é"));
    EXPECT_THAT(all_words(permutations("aé€")),
                ElementsAre("aé€", "a€é", "éa€", "é€a", "€aé", "€éa"));
    EXPECT_EQ(all_words(pattern("ü%")).front(), "ü0");
    EXPECT_EQ(word_at(pattern("%€@"), 259), "9€z");
}

TEST(Enumerator, ProducesExactlyTotalSize) {
    for (auto const& space : sample_spaces()) {
        Enumerator e{space};
        BigInt     n = 0;
        while (!e.done()) {
            e.next();
            ++n;
        }
        EXPECT_EQ(n, total_size(space));
        EXPECT_EQ(e.position(), e.size());
        EXPECT_THROW(e.next(), std::out_of_range);
    }
}

TEST(Enumerator, CombinationsNeverRepeat) {
    for (auto const& space :
         {SpaceSpecification{range_combinations("abc", 0, 4)},
          SpaceSpecification{pattern("a^b%")}}) {
        auto const words = all_words(space);
        EXPECT_EQ(std::set<std::string>(words.begin(), words.end()).size(),
                  words.size());
    }
}

TEST(Enumerator, SkipAheadMatchesDiscarding) {
    RandomIndexes random;
    for (auto const& space : sample_spaces()) {
        auto const words = all_words(space);
        for (int trial = 0; trial < 20; ++trial) {
            size_t const n = random.below(words.size() + 1).get_ui();
            size_t const m = random.below(words.size() + 1).get_ui();
            Enumerator   e{space};
            e.skip_ahead(n);
            EXPECT_EQ(e.position(), n);
            std::vector<std::string> got;
            for (size_t i = 0; i < m && !e.done(); ++i) {
                got.push_back(e.next());
            }
            std::vector<std::string> const expected(
                words.begin() + n, words.begin() + std::min(n + m, words.size()));
            EXPECT_EQ(got, expected) << "skip " << n << " read " << m;
        }
    }
}

TEST(Enumerator, SkipAheadTwice) {
    auto const words = all_words(range_combinations("abc", 1, 3));
    Enumerator e{range_combinations("abc", 1, 3)};
    e.skip_ahead(2);
    EXPECT_EQ(e.next(), words[2]);
    e.skip_ahead(5);
    EXPECT_EQ(e.next(), words[8]);
    e.skip_ahead(0);
    EXPECT_EQ(e.next(), words[9]);
}

TEST(Enumerator, SkipPastEnd) {
    Enumerator e{range_combinations("01", 1, 2)};
    e.skip_ahead(6);
    EXPECT_TRUE(e.done());
    Enumerator f{permutations("abc")};
    f.skip_ahead(BigInt{"100000000000000000000000"});
    EXPECT_TRUE(f.done());
    EXPECT_EQ(f.position(), 6);
}

TEST(Enumerator, NegativeSkip) {
    Enumerator e{pattern("@")};
    EXPECT_THROW(e.skip_ahead(-1), std::invalid_argument);
}

TEST(Enumerator, word_at) {
    for (auto const& space : sample_spaces()) {
        auto const words = all_words(space);
        for (size_t i = 0; i < words.size(); ++i) {
            EXPECT_EQ(word_at(space, i), words[i]) << i;
        }
        EXPECT_THROW(word_at(space, words.size()), std::out_of_range);
        EXPECT_THROW(word_at(space, -1), std::out_of_range);
    }
}

TEST(Enumerator, SeekBeyond64Bits) {
    std::string charset;
    for (auto const c : std::views::iota(32, 127)) {
        charset += static_cast<char>(c);
    }
    auto const space = range_combinations(charset, 1, 20);
    auto const total = total_size(space);

    EXPECT_EQ(word_at(space, 0), " ");
    EXPECT_EQ(word_at(space, total - 1), std::string(20, '~'));
    // the first word of length 20 follows every shorter word
    EXPECT_EQ(word_at(space, total - power(95, 20)), std::string(20, ' '));
    EXPECT_EQ(word_at(space, total - power(95, 20) - 1), std::string(19, '~'));

    Enumerator e{space};
    e.skip_ahead(total - 2);
    EXPECT_EQ(e.next(), std::string(19, '~') + "}");
    EXPECT_EQ(e.next(), std::string(20, '~'));
    EXPECT_TRUE(e.done());
}

TEST(Enumerator, SeekAgreesWithStepping) {
    // word_at seeks directly, next() steps from the word before
    RandomIndexes random;
    for (auto const& space :
         {SpaceSpecification{range_combinations("aé€0123456789", 10, 30)},
          SpaceSpecification{pattern("@@@@@@@@^^^^^^^^%%%%%%%%")},
          SpaceSpecification{permutations("abcdefghijklmnopqrstuvwxyzé€")}}) {
        BigInt const total = total_size(space);
        for (int trial = 0; trial < 20; ++trial) {
            BigInt const index = random.below(total - 1);
            Enumerator   e{space};
            e.skip_ahead(index);
            EXPECT_EQ(e.next(), word_at(space, index));
            EXPECT_EQ(e.next(), word_at(space, index + 1)) << index.get_str();
        }
    }
}

TEST(Enumerator, SeekLargePermutation) {
    auto const space = permutations("abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(word_at(space, 0), "abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(word_at(space, 1), "abcdefghijklmnopqrstuvwxzy");
    EXPECT_EQ(word_at(space, factorial(26) - 1), "zyxwvutsrqponmlkjihgfedcba");
    EXPECT_EQ(word_at(space, factorial(25)), "bacdefghijklmnopqrstuvwxyz");
}

TEST(Enumerator, InvalidSpace) {
    EXPECT_THROW(Enumerator{SpaceSpecification{}}, NoModeSelected);
    EXPECT_THROW((Enumerator{RangeCombinations{"ab", 2, 1}}), InvalidLengthRange);
}
