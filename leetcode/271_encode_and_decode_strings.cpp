#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "leetcode/271_encode_and_decode_strings.h"

using leetcode::encode_and_decode_strings::Solution;

// Helper function to print a list of strings as ["a", "b"]
void printStrings(const std::vector<std::string>& strs) {
    std::cout << "[";
    for (size_t i = 0; i < strs.size(); ++i) {
        std::cout << (i ? ", " : "") << "\"" << strs[i] << "\"";
    }
    std::cout << "]" << std::endl;
}

int main() {
    Solution sol;

    std::cout << "--- LeetCode 271: Encode and Decode Strings ---" << std::endl;

    std::vector<std::vector<std::string>> inputs = {
        {"neet", "code", "love", "you"},
        {"we", "say", ":", "yes"},
        {"a#b", "#", ""},
    };

    for (auto& strs : inputs) {
        std::cout << "Input: ";
        printStrings(strs);

        std::string encoded = sol.encode(strs);
        std::cout << "Encoded: \"" << encoded << "\"" << std::endl;

        try {
            std::cout << "Decoded: ";
            printStrings(sol.decode(encoded));
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    return 0;
}
