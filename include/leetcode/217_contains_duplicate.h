#ifndef LEETCODE_217_CONTAINS_DUPLICATE_H
#define LEETCODE_217_CONTAINS_DUPLICATE_H

#include <unordered_set>
#include <vector>

namespace leetcode {
namespace contains_duplicate {

/**
 * @brief LeetCode 217: Contains Duplicate (存在重复元素)
 *
 * Given an integer array `nums`, return true if any value appears at least twice, and false if every element is distinct.
 *
 * Keep a hash set of the values seen so far and stop at the first value that is already in it.
 * Time O(N), Space O(N).
 */
class Solution {
public:
    bool containsDuplicate(std::vector<int>& nums) {
        std::unordered_set<int> seen;
        for (int num : nums) {
            if (!seen.insert(num).second) {
                return true;
            }
        }
        return false;
    }
};

} // namespace contains_duplicate
} // namespace leetcode

#endif // LEETCODE_217_CONTAINS_DUPLICATE_H
