#include <iostream>
#include <string>

#include "leetcode/242_valid_anagram.h"

using leetcode::valid_anagram::Solution;

// Test function
int main() {
    Solution sol;

    std::cout << "--- LeetCode 242: Valid Anagram ---" << std::endl;

    std::string s1 = "racecar", t1 = "carrace";
    std::cout << "Input: s = \"" << s1 << "\", t = \"" << t1 << "\"" << std::endl;
    std::cout << "Output: " << (sol.isAnagram(s1, t1) ? "true" : "false") << std::endl; // Expected: true

    std::string s2 = "jar", t2 = "jam";
    std::cout << "Input: s = \"" << s2 << "\", t = \"" << t2 << "\"" << std::endl;
    std::cout << "Output: " << (sol.isAnagram(s2, t2) ? "true" : "false") << std::endl; // Expected: false

    return 0;
}
