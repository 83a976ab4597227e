#ifndef LEETCODE_238_PRODUCT_OF_ARRAY_EXCEPT_SELF_H
#define LEETCODE_238_PRODUCT_OF_ARRAY_EXCEPT_SELF_H

#include <vector>

namespace leetcode {
namespace product_of_array_except_self {

/**
 * @brief LeetCode 238: Product of Array Except Self (除自身以外数组的乘积)
 *
 * Problem Statement:
 * Given an integer array `nums`, return an array `answer` such that `answer[i]` is the product of all elements of `nums` except `nums[i]`.
 * Every such product is guaranteed to fit in a 32-bit integer. The algorithm must run in O(N) time and must not use division.
 *
 * Algorithm Explanation:
 * `answer[i]` is (product of everything left of i) * (product of everything right of i).
 *
 * 1. Left pass: `answer[0] = 1`, and `answer[i] = answer[i - 1] * nums[i - 1]`. Now each slot holds its prefix product.
 * 2. Right pass: keep a running suffix product `right_product`, starting at 1 for the last slot. Walking from right to left, fold `nums[i + 1]` into it and multiply it into `answer[i]`.
 *
 * Only the final answers are guaranteed to fit in an int, not the running products. With two or more zeros every answer is 0, so we return early.
 * With at most one zero, every running product is bounded by some answer and cannot overflow.
 *
 * Complexity Analysis:
 * - Time Complexity: O(N), two passes.
 * - Space Complexity: O(1) apart from the output array.
 */
class Solution {
public:
    std::vector<int> productExceptSelf(std::vector<int>& nums) {
        int n = static_cast<int>(nums.size());
        if (n == 0) {
            return {};
        }

        int zero_count = 0;
        for (int num : nums) {
            if (num == 0) {
                ++zero_count;
            }
        }
        if (zero_count >= 2) {
            return std::vector<int>(n, 0);
        }

        std::vector<int> answer(n, 1);

        // Prefix products
        for (int i = 1; i < n; ++i) {
            answer[i] = answer[i - 1] * nums[i - 1];
        }

        // Suffix products
        int right_product = 1;
        for (int i = n - 2; i >= 0; --i) {
            right_product *= nums[i + 1];
            answer[i] *= right_product;
        }

        return answer;
    }
};

} // namespace product_of_array_except_self
} // namespace leetcode

#endif // LEETCODE_238_PRODUCT_OF_ARRAY_EXCEPT_SELF_H
