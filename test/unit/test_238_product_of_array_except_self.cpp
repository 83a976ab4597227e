/***
 * Name: test_238_product_of_array_except_self
 * Purpose: Compare prefix/suffix products against a brute-force product.
 */
#include <gtest/gtest.h>
#include <vector>
#include "leetcode/238_product_of_array_except_self.h"

using leetcode::product_of_array_except_self::Solution;

static std::vector<int> bruteForce(const std::vector<int>& nums) {
  std::vector<int> out(nums.size(), 1);
  for (size_t i = 0; i < nums.size(); ++i)
    for (size_t j = 0; j < nums.size(); ++j)
      if (i != j) out[i] *= nums[j];
  return out;
}

TEST(ProductExceptSelf, SampleInputs) {
  Solution sol;
  std::vector<int> a{1, 2, 4, 6};
  EXPECT_EQ(sol.productExceptSelf(a), (std::vector<int>{48, 24, 12, 8}));
  std::vector<int> b{-1, 0, 1, 2, 3};
  EXPECT_EQ(sol.productExceptSelf(b), (std::vector<int>{0, -6, 0, 0, 0}));
}

TEST(ProductExceptSelf, TwoZeros) {
  Solution sol;
  std::vector<int> nums{0, 4, 0};
  EXPECT_EQ(sol.productExceptSelf(nums), (std::vector<int>{0, 0, 0}));
}

TEST(ProductExceptSelf, TwoZerosAfterLargePrefix) {
  Solution sol;
  // 20^10 does not fit in an int, but every answer is 0
  std::vector<int> nums(10, 20);
  nums.push_back(0);
  nums.push_back(0);
  EXPECT_EQ(sol.productExceptSelf(nums), std::vector<int>(12, 0));
}

TEST(ProductExceptSelf, TwoZerosBeforeLargeSuffix) {
  Solution sol;
  std::vector<int> nums{0, 0};
  nums.insert(nums.end(), 10, -20);
  EXPECT_EQ(sol.productExceptSelf(nums), std::vector<int>(12, 0));
}

TEST(ProductExceptSelf, SingleZeroAmongLargeValues) {
  Solution sol;
  // 20^7 fits, so the answer at the zero is the only nonzero slot
  std::vector<int> nums{20, 20, 20, 0, 20, 20, 20, 20};
  std::vector<int> expected(8, 0);
  expected[3] = 1280000000;
  EXPECT_EQ(sol.productExceptSelf(nums), expected);
}

TEST(ProductExceptSelf, MatchesBruteForce) {
  Solution sol;
  std::vector<std::vector<int>> cases{
      {2, 3},
      {-2, -3, 4, 5},
      {20, -20, 1, -1, 3, 7},
      {1, 1, 1, 1, 1, 1, 1},
  };
  for (auto& nums : cases) {
    EXPECT_EQ(sol.productExceptSelf(nums), bruteForce(nums));
  }
}

TEST(ProductExceptSelf, DegenerateSizes) {
  Solution sol;
  std::vector<int> empty;
  EXPECT_TRUE(sol.productExceptSelf(empty).empty());
  std::vector<int> one{9};
  EXPECT_EQ(sol.productExceptSelf(one), (std::vector<int>{1}));
}
