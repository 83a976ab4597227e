#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "leetcode/049_group_anagrams.h"

using leetcode::group_anagrams::Solution;

// Helper function to print groups as [["a", "b"], ["c"]]
void printGroups(const std::vector<std::vector<std::string>>& groups) {
    std::cout << "[";
    for (size_t i = 0; i < groups.size(); ++i) {
        std::cout << (i ? ", [" : "[");
        for (size_t j = 0; j < groups[i].size(); ++j) {
            std::cout << (j ? ", " : "") << "\"" << groups[i][j] << "\"";
        }
        std::cout << "]";
    }
    std::cout << "]" << std::endl;
}

int main() {
    Solution sol;

    std::cout << "--- LeetCode 49: Group Anagrams ---" << std::endl;

    std::vector<std::string> strs1 = {"act", "pots", "tops", "cat", "stop", "hat"};
    std::cout << "Input: [\"act\", \"pots\", \"tops\", \"cat\", \"stop\", \"hat\"]" << std::endl;
    std::cout << "Output (sorted key): ";
    printGroups(sol.groupAnagrams(strs1)); // Expected: [["act", "cat"], ["pots", "tops", "stop"], ["hat"]]

    try {
        std::cout << "Output (count key):  ";
        printGroups(sol.groupAnagramsCount(strs1)); // Expected: same groups as the sorted key
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::vector<std::string> strs2 = {"x"};
    std::cout << "Input: [\"x\"]" << std::endl;
    std::cout << "Output: ";
    printGroups(sol.groupAnagrams(strs2)); // Expected: [["x"]]

    std::vector<std::string> strs3 = {""};
    std::cout << "Input: [\"\"]" << std::endl;
    std::cout << "Output: ";
    printGroups(sol.groupAnagrams(strs3)); // Expected: [[""]]

    return 0;
}
