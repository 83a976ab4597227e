#ifndef LEETCODE_049_GROUP_ANAGRAMS_H
#define LEETCODE_049_GROUP_ANAGRAMS_H

#include <algorithm>
#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace leetcode {
namespace group_anagrams {

/**
 * @brief LeetCode 49: Group Anagrams (字母异位词分组)
 *
 * Problem Statement:
 * Given an array of strings `strs`, group the anagrams together. An anagram is a string that contains exactly the same characters as another string, in any order.
 *
 * Algorithm Explanation:
 * Two strings are anagrams exactly when they share a canonical "signature". We build the signature for every string, and use a map from signature to the position of its group in the result.
 *
 * There are two ways to build the signature:
 * a) `groupAnagrams`: sort the characters of the string. "eat", "tea" and "ate" all become "aet".
 * b) `groupAnagramsCount`: count how many times each of the 26 lowercase letters occurs. The 26 counts are the key, so no sorting is needed.
 *
 * Groups appear in the order their first member appears in the input, and members keep their input order. An empty string is an anagram of every other empty string, so all of them end up in one group.
 *
 * Complexity Analysis (M strings, longest of length N, G groups):
 * - Sorting key: Time O(M * N log N), Space O(M * N).
 * - Counting key: Time O(M * (N + 26 log G)), since the count arrays are kept in an ordered map. Space O(M * N).
 */
class Solution {
public:
    std::vector<std::vector<std::string>> groupAnagrams(std::vector<std::string>& strs) {
        std::vector<std::vector<std::string>> groups;
        std::unordered_map<std::string, size_t> key_to_group;

        for (const std::string& s : strs) {
            std::string key = s;
            std::sort(key.begin(), key.end());

            auto it = key_to_group.find(key);
            if (it == key_to_group.end()) {
                key_to_group.emplace(key, groups.size());
                groups.push_back({s});
            } else {
                groups[it->second].push_back(s);
            }
        }
        return groups;
    }

    std::vector<std::vector<std::string>> groupAnagramsCount(std::vector<std::string>& strs) {
        std::vector<std::vector<std::string>> groups;
        std::map<std::array<int, 26>, size_t> key_to_group;

        for (const std::string& s : strs) {
            std::array<int, 26> count{};
            for (char c : s) {
                if (c < 'a' || c > 'z') {
                    throw std::invalid_argument("groupAnagramsCount: \"" + s + "\" is not lowercase a-z");
                }
                ++count[c - 'a'];
            }

            auto it = key_to_group.find(count);
            if (it == key_to_group.end()) {
                key_to_group.emplace(count, groups.size());
                groups.push_back({s});
            } else {
                groups[it->second].push_back(s);
            }
        }
        return groups;
    }
};

} // namespace group_anagrams
} // namespace leetcode

#endif // LEETCODE_049_GROUP_ANAGRAMS_H
