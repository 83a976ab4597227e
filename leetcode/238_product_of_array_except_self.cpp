#include <iostream>
#include <vector>

#include "leetcode/238_product_of_array_except_self.h"

using leetcode::product_of_array_except_self::Solution;

// Helper function to print a vector as [a, b, c]
void printVector(const std::vector<int>& v) {
    std::cout << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        std::cout << (i ? ", " : "") << v[i];
    }
    std::cout << "]" << std::endl;
}

// Test function
int main() {
    Solution sol;

    std::cout << "--- LeetCode 238: Product of Array Except Self ---" << std::endl;

    std::vector<int> nums1 = {1, 2, 4, 6};
    std::cout << "Input: ";
    printVector(nums1);
    std::cout << "Output: ";
    printVector(sol.productExceptSelf(nums1)); // Expected: [48, 24, 12, 8]

    std::vector<int> nums2 = {-1, 0, 1, 2, 3};
    std::cout << "Input: ";
    printVector(nums2);
    std::cout << "Output: ";
    printVector(sol.productExceptSelf(nums2)); // Expected: [0, -6, 0, 0, 0]

    return 0;
}
