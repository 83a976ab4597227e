#ifndef LEETCODE_128_LONGEST_CONSECUTIVE_SEQUENCE_H
#define LEETCODE_128_LONGEST_CONSECUTIVE_SEQUENCE_H

#include <algorithm>
#include <limits>
#include <unordered_set>
#include <vector>

namespace leetcode {
namespace longest_consecutive_sequence {

/**
 * @brief LeetCode 128: Longest Consecutive Sequence (最长连续序列)
 *
 * Problem Statement:
 * Given an unsorted array of integers `nums`, return the length of the longest sequence of consecutive values (each exactly 1 greater than the previous).
 * The elements do not have to be adjacent in the array. The algorithm must run in O(N) time.
 *
 * Algorithm Explanation:
 * Put every value into a hash set. A value `x` is the start of a run only if `x - 1` is not in the set.
 * For each run start, walk forward through `x + 1`, `x + 2`, ... while they are present and count the length.
 *
 * Values that are not run starts are skipped, so each value is visited by at most one forward walk. Duplicates collapse in the set and do not change the answer.
 *
 * Complexity Analysis:
 * - Time Complexity: O(N) expected.
 * - Space Complexity: O(N) for the hash set.
 */
class Solution {
public:
    int longestConsecutive(std::vector<int>& nums) {
        std::unordered_set<int> num_set(nums.begin(), nums.end());
        int longest_streak = 0;

        for (int num : num_set) {
            // Only start counting from the beginning of a run
            if (num != std::numeric_limits<int>::min() && num_set.count(num - 1)) {
                continue;
            }

            int current_num = num;
            int current_streak = 1;
            while (current_num != std::numeric_limits<int>::max() && num_set.count(current_num + 1)) {
                ++current_num;
                ++current_streak;
            }

            longest_streak = std::max(longest_streak, current_streak);
        }

        return longest_streak;
    }
};

} // namespace longest_consecutive_sequence
} // namespace leetcode

#endif // LEETCODE_128_LONGEST_CONSECUTIVE_SEQUENCE_H
