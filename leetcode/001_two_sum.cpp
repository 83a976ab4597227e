#include <iostream>
#include <vector>

#include "leetcode/001_two_sum.h"

using leetcode::two_sum::Solution;

// Test function
int main() {
    Solution sol;

    std::cout << "--- LeetCode 1: Two Sum ---" << std::endl;

    std::vector<int> nums1 = {3, 4, 5, 6};
    std::cout << "Input: nums = [3, 4, 5, 6], target = 7" << std::endl;
    std::vector<int> result = sol.twoSum(nums1, 7);
    if (!result.empty()) {
        std::cout << "Output: [" << result[0] << ", " << result[1] << "]" << std::endl; // Expected: [0, 1]
    } else {
        std::cout << "No solution found." << std::endl;
    }

    std::vector<int> nums2 = {4, 5, 6};
    std::cout << "Input: nums = [4, 5, 6], target = 10" << std::endl;
    result = sol.twoSum(nums2, 10);
    if (!result.empty()) {
        std::cout << "Output: [" << result[0] << ", " << result[1] << "]" << std::endl; // Expected: [0, 2]
    } else {
        std::cout << "No solution found." << std::endl;
    }

    std::vector<int> nums3 = {5, 5};
    std::cout << "Input: nums = [5, 5], target = 10" << std::endl;
    result = sol.twoSum(nums3, 10);
    if (!result.empty()) {
        std::cout << "Output: [" << result[0] << ", " << result[1] << "]" << std::endl; // Expected: [0, 1]
    } else {
        std::cout << "No solution found." << std::endl;
    }

    return 0;
}
