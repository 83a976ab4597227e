#include <iostream>
#include <vector>

#include "leetcode/217_contains_duplicate.h"

using leetcode::contains_duplicate::Solution;

int main() {
    Solution sol;

    std::cout << "--- LeetCode 217: Contains Duplicate ---" << std::endl;

    std::vector<int> nums1 = {1, 2, 3, 3};
    std::cout << "Input: [1, 2, 3, 3]" << std::endl;
    std::cout << "Output: " << (sol.containsDuplicate(nums1) ? "true" : "false") << std::endl; // Expected: true

    std::vector<int> nums2 = {1, 2, 3, 4};
    std::cout << "Input: [1, 2, 3, 4]" << std::endl;
    std::cout << "Output: " << (sol.containsDuplicate(nums2) ? "true" : "false") << std::endl; // Expected: false

    return 0;
}
