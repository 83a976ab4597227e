/***
 * Name: test_242_valid_anagram
 * Purpose: Ensure anagram checks compare character multisets, not just sets.
 */
#include <gtest/gtest.h>
#include <string>
#include "leetcode/242_valid_anagram.h"

using leetcode::valid_anagram::Solution;

TEST(ValidAnagram, SampleInputs) {
  Solution sol;
  EXPECT_TRUE(sol.isAnagram("racecar", "carrace"));
  EXPECT_FALSE(sol.isAnagram("jar", "jam"));
  EXPECT_TRUE(sol.isAnagram("anagram", "nagaram"));
  EXPECT_FALSE(sol.isAnagram("rat", "car"));
}

TEST(ValidAnagram, DifferentMultiplicities) {
  Solution sol;
  EXPECT_FALSE(sol.isAnagram("aab", "abb"));
  EXPECT_FALSE(sol.isAnagram("a", "aa"));
}

TEST(ValidAnagram, EmptyStrings) {
  Solution sol;
  EXPECT_TRUE(sol.isAnagram("", ""));
  EXPECT_FALSE(sol.isAnagram("", "a"));
}

TEST(ValidAnagram, ArbitraryBytes) {
  Solution sol;
  EXPECT_TRUE(sol.isAnagram("A b#\xC3\xA9", "\xA9#b \xC3" "A"));
  EXPECT_FALSE(sol.isAnagram("Ab", "ab"));
}
