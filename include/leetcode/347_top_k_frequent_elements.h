#ifndef LEETCODE_347_TOP_K_FREQUENT_ELEMENTS_H
#define LEETCODE_347_TOP_K_FREQUENT_ELEMENTS_H

#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>

namespace leetcode {
namespace top_k_frequent_elements {

/**
 * @brief LeetCode 347: Top K Frequent Elements (前 K 个高频元素)
 *
 * Problem Statement:
 * Given an integer array `nums` and an integer `k`, return the `k` most frequent elements, in any order.
 * The answer is guaranteed to be unique.
 *
 * Algorithm Explanation:
 * Both methods first count how often each value occurs with a hash map.
 *
 * a) `topKFrequent`: copy the (value, count) pairs into a vector and `std::partial_sort` only the first `k` of them by descending count.
 * b) `topKFrequentBucketSort`: a value can occur at most N times, so make N + 1 buckets where `buckets[c]` holds every value that occurs exactly `c` times.
 *    Walk the buckets from N down to 1 and collect values until we have `k` of them. No comparison sort is needed.
 *
 * If `k` is at least the number of distinct values, every distinct value is returned. A non-positive `k` returns nothing.
 *
 * Complexity Analysis (D distinct values):
 * - Partial sort: Time O(N + D log k), Space O(D).
 * - Bucket sort: Time O(N), Space O(N).
 */
class Solution {
public:
    std::vector<int> topKFrequent(std::vector<int>& nums, int k) {
        if (k <= 0) {
            return {};
        }

        std::unordered_map<int, int> frequency_map;
        for (int num : nums) {
            ++frequency_map[num];
        }

        std::vector<std::pair<int, int>> entries(frequency_map.begin(), frequency_map.end());
        size_t take = std::min(static_cast<size_t>(k), entries.size());
        std::partial_sort(entries.begin(), entries.begin() + take, entries.end(),
                          [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
                              return a.second > b.second;
                          });

        std::vector<int> result;
        result.reserve(take);
        for (size_t i = 0; i < take; ++i) {
            result.push_back(entries[i].first);
        }
        return result;
    }

    std::vector<int> topKFrequentBucketSort(std::vector<int>& nums, int k) {
        std::vector<int> result;
        if (k <= 0) {
            return result;
        }

        std::unordered_map<int, int> frequency_map;
        for (int num : nums) {
            ++frequency_map[num];
        }

        // buckets[c] holds the values that occur exactly c times
        std::vector<std::vector<int>> buckets(nums.size() + 1);
        for (const auto& [num, freq] : frequency_map) {
            buckets[freq].push_back(num);
        }

        for (size_t freq = buckets.size() - 1; freq > 0; --freq) {
            for (int num : buckets[freq]) {
                result.push_back(num);
                if (static_cast<int>(result.size()) == k) {
                    return result;
                }
            }
        }
        return result;
    }
};

} // namespace top_k_frequent_elements
} // namespace leetcode

#endif // LEETCODE_347_TOP_K_FREQUENT_ELEMENTS_H
