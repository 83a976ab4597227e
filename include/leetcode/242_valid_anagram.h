#ifndef LEETCODE_242_VALID_ANAGRAM_H
#define LEETCODE_242_VALID_ANAGRAM_H

#include <array>
#include <string>

namespace leetcode {
namespace valid_anagram {

/**
 * @brief LeetCode 242: Valid Anagram (有效的字母异位词)
 *
 * Problem Statement:
 * Given two strings `s` and `t`, return true if `t` is an anagram of `s`, i.e. both contain exactly the same characters with the same counts.
 *
 * Algorithm Explanation:
 * Strings of different length can never be anagrams. Otherwise, count every byte of `s` up and every byte of `t` down in a table of 256 counters.
 * The strings are anagrams exactly when every counter ends at zero.
 *
 * Complexity Analysis:
 * - Time Complexity: O(N + M).
 * - Space Complexity: O(1), the table has a fixed size.
 */
class Solution {
public:
    bool isAnagram(std::string s, std::string t) {
        if (s.length() != t.length()) {
            return false;
        }

        std::array<int, 256> count{};
        for (size_t i = 0; i < s.length(); ++i) {
            ++count[static_cast<unsigned char>(s[i])];
            --count[static_cast<unsigned char>(t[i])];
        }

        for (int c : count) {
            if (c != 0) {
                return false;
            }
        }
        return true;
    }
};

} // namespace valid_anagram
} // namespace leetcode

#endif // LEETCODE_242_VALID_ANAGRAM_H
