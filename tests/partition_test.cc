// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/sequence/partition.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace arith {
namespace {

using Strings = std::vector<std::string>;

TEST(PartitionTest, PredicateKeepsOrderInBothParts) {
    const Strings cast{"Vivien", "Marlon", "Kim", "Karl"};
    auto parts = partitioned(cast, [](const std::string& name) {
        return name.starts_with("K");
    });
    EXPECT_EQ(parts.matching, (Strings{"Kim", "Karl"}));
    EXPECT_EQ(parts.non_matching, (Strings{"Vivien", "Marlon"}));
}

TEST(PartitionTest, PredicateOnCharacters) {
    const std::string text = "aBcD";
    auto is_lower = [](char c) {
        return std::islower(static_cast<unsigned char>(c)) != 0;
    };
    auto parts = partitioned(text, is_lower);
    EXPECT_EQ(parts.matching, (std::vector<char>{'a', 'c'}));
    EXPECT_EQ(parts.non_matching, (std::vector<char>{'B', 'D'}));
}

TEST(PartitionTest, PredicateEmptyAndExhaustive) {
    auto is_lower = [](const std::string& s) { return s == "x" || s == "y"; };

    auto none = partitioned(Strings{}, is_lower);
    EXPECT_TRUE(none.matching.empty());
    EXPECT_TRUE(none.non_matching.empty());

    auto all = partitioned(Strings{"x", "y"}, is_lower);
    EXPECT_EQ(all.matching, (Strings{"x", "y"}));
    EXPECT_TRUE(all.non_matching.empty());

    auto neither = partitioned(Strings{"A", "B"}, is_lower);
    EXPECT_TRUE(neither.matching.empty());
    EXPECT_EQ(neither.non_matching, (Strings{"A", "B"}));
}

TEST(PartitionTest, SplitAtPosition) {
    const std::vector<int> v{1, 2, 3};

    auto at0 = partitioned(v, size_t{0});
    EXPECT_TRUE(at0.prefix.empty());
    EXPECT_EQ(at0.suffix, (std::vector<int>{1, 2, 3}));

    auto at1 = partitioned(v, size_t{1});
    EXPECT_EQ(at1.prefix, (std::vector<int>{1}));
    EXPECT_EQ(at1.suffix, (std::vector<int>{2, 3}));

    auto at2 = partitioned(v, size_t{2});
    EXPECT_EQ(at2.prefix, (std::vector<int>{1, 2}));
    EXPECT_EQ(at2.suffix, (std::vector<int>{3}));

    auto at3 = partitioned(v, size_t{3});
    EXPECT_EQ(at3.prefix, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(at3.suffix.empty());
}

TEST(PartitionTest, SplitBeyondEnd) {
    const std::vector<int> v{1, 2, 3};
    auto parts = partitioned(v, size_t{4});
    EXPECT_EQ(parts.prefix, v);
    EXPECT_TRUE(parts.suffix.empty());
}

}  // namespace
}  // namespace arith
