#include <iostream>
#include <vector>

#include "leetcode/347_top_k_frequent_elements.h"

using leetcode::top_k_frequent_elements::Solution;

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

    std::cout << "--- LeetCode 347: Top K Frequent Elements ---" << std::endl;

    std::vector<int> nums1 = {1, 2, 2, 3, 3, 3};
    std::cout << "Input: nums = [1, 2, 2, 3, 3, 3], k = 2" << std::endl;
    std::cout << "Output (partial sort): ";
    printVector(sol.topKFrequent(nums1, 2)); // Expected: [3, 2]
    std::cout << "Output (bucket sort):  ";
    printVector(sol.topKFrequentBucketSort(nums1, 2)); // Expected: [3, 2]

    std::vector<int> nums2 = {7, 7};
    std::cout << "Input: nums = [7, 7], k = 1" << std::endl;
    std::cout << "Output: ";
    printVector(sol.topKFrequent(nums2, 1)); // Expected: [7]

    return 0;
}
