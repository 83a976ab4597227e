/***
 * Name: test_128_longest_consecutive_sequence
 * Purpose: Check run detection on samples, duplicates, reordering and int limits.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <vector>
#include "leetcode/128_longest_consecutive_sequence.h"

using leetcode::longest_consecutive_sequence::Solution;

TEST(LongestConsecutive, SampleInputs) {
  Solution sol;
  std::vector<int> a{2, 20, 4, 10, 3, 4, 5};
  EXPECT_EQ(sol.longestConsecutive(a), 4);
  std::vector<int> b{0, 3, 2, 5, 4, 6, 1, 1};
  EXPECT_EQ(sol.longestConsecutive(b), 7);
}

TEST(LongestConsecutive, EmptyAndSingle) {
  Solution sol;
  std::vector<int> empty;
  EXPECT_EQ(sol.longestConsecutive(empty), 0);
  std::vector<int> one{42};
  EXPECT_EQ(sol.longestConsecutive(one), 1);
}

TEST(LongestConsecutive, InvariantUnderReorderAndDedup) {
  Solution sol;
  std::vector<int> nums{9, 1, -3, 10, 4, 20, 2, 8, -2, -1, 0, 3};
  const int expected = sol.longestConsecutive(nums);
  EXPECT_EQ(expected, 8);  // -3 .. 4

  std::vector<int> reversed(nums.rbegin(), nums.rend());
  EXPECT_EQ(sol.longestConsecutive(reversed), expected);

  std::vector<int> sorted = nums;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sol.longestConsecutive(sorted), expected);

  std::vector<int> doubled = nums;
  doubled.insert(doubled.end(), nums.begin(), nums.end());
  EXPECT_EQ(sol.longestConsecutive(doubled), expected);
}

TEST(LongestConsecutive, RunsAtIntLimits) {
  Solution sol;
  const int lo = std::numeric_limits<int>::min();
  const int hi = std::numeric_limits<int>::max();
  std::vector<int> nums{hi, hi - 1, hi - 2, lo, lo + 1};
  EXPECT_EQ(sol.longestConsecutive(nums), 3);
}
