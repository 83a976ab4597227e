#ifndef LEETCODE_001_TWO_SUM_H
#define LEETCODE_001_TWO_SUM_H

#include <vector>
#include <unordered_map>

namespace leetcode {
namespace two_sum {

/**
 * @brief LeetCode 1: Two Sum (两数之和)
 *
 * Problem Statement:
 * Given an array of integers `nums` and an integer `target`, return indices `i` and `j` such that `nums[i] + nums[j] == target` and `i != j`.
 * You may assume that each input has exactly one solution. Return the smaller index first.
 *
 * Algorithm Explanation:
 * We iterate through the array once, keeping a hash map from every value seen so far to its index. For each element `nums[i]`, its "complement" is `target - nums[i]`.
 *
 * 1. If the complement is already in the map, the pair is (index of complement, i). Since the stored index was seen earlier, it is the smaller one.
 * 2. Otherwise, record `nums[i] -> i` and move on.
 *
 * The lookup happens before the insertion, so an element is never paired with itself, and for `[5, 5]` with target 10 the first 5 is still in the map when the second one is checked.
 *
 * Complexity Analysis:
 * - Time Complexity: O(N), one pass with average O(1) hash map lookups and insertions.
 * - Space Complexity: O(N), in the worst case every element is stored in the hash map.
 */
class Solution {
public:
    std::vector<int> twoSum(std::vector<int>& nums, int target) {
        std::unordered_map<int, int> num_to_index_map;
        for (int i = 0; i < static_cast<int>(nums.size()); ++i) {
            int complement = target - nums[i];
            auto it = num_to_index_map.find(complement);
            if (it != num_to_index_map.end()) {
                return {it->second, i};
            }
            num_to_index_map[nums[i]] = i;
        }
        // Should not happen based on problem description (exactly one solution)
        return {};
    }
};

} // namespace two_sum
} // namespace leetcode

#endif // LEETCODE_001_TWO_SUM_H
