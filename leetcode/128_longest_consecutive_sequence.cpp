#include <iostream>
#include <vector>

#include "leetcode/128_longest_consecutive_sequence.h"

using leetcode::longest_consecutive_sequence::Solution;

// Test function
int main() {
    Solution sol;

    std::cout << "--- LeetCode 128: Longest Consecutive Sequence ---" << std::endl;

    std::vector<int> nums1 = {2, 20, 4, 10, 3, 4, 5};
    std::cout << "Input: [2, 20, 4, 10, 3, 4, 5]" << std::endl;
    std::cout << "Output: " << sol.longestConsecutive(nums1) << std::endl; // Expected: 4 ([2, 3, 4, 5])

    std::vector<int> nums2 = {0, 3, 2, 5, 4, 6, 1, 1};
    std::cout << "Input: [0, 3, 2, 5, 4, 6, 1, 1]" << std::endl;
    std::cout << "Output: " << sol.longestConsecutive(nums2) << std::endl; // Expected: 7

    std::vector<int> nums3 = {};
    std::cout << "Input: []" << std::endl;
    std::cout << "Output: " << sol.longestConsecutive(nums3) << std::endl; // Expected: 0

    return 0;
}
