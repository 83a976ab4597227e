#ifndef LEETCODE_271_ENCODE_AND_DECODE_STRINGS_H
#define LEETCODE_271_ENCODE_AND_DECODE_STRINGS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace leetcode {
namespace encode_and_decode_strings {

/**
 * @brief LeetCode 271: Encode and Decode Strings (字符串的编码与解码)
 *
 * Problem Statement:
 * Design an algorithm to encode a list of strings into a single string, and to decode that string back into the original list.
 * The strings may contain any character, including whatever separator the encoding uses.
 *
 * Algorithm Explanation (length prefix):
 * Every string `s` is written as `<length of s in decimal>#<s>`. For example ["neet", "code"] becomes "4#neet4#code", and [""] becomes "0#".
 *
 * Decoding reads digits up to the first '#', converts them to a length `L`, and then takes exactly the next `L` characters as the payload, whatever they are.
 * Because the payload is never scanned for '#', a payload like "a#b" or "#" cannot be confused with the next length field.
 *
 * `decode` throws std::invalid_argument if the buffer was not produced by `encode` (missing '#', non-digit length, or a length running past the end of the buffer).
 *
 * Complexity Analysis (M = total length of all strings):
 * - Time Complexity: O(M) for both encode and decode.
 * - Space Complexity: O(M) for the output.
 */
class Solution {
public:
    std::string encode(std::vector<std::string>& strs) {
        std::string encoded;
        for (const std::string& s : strs) {
            encoded += std::to_string(s.length());
            encoded += kDelimiter;
            encoded += s;
        }
        return encoded;
    }

    std::vector<std::string> decode(std::string s) {
        std::vector<std::string> decoded_strs;
        size_t i = 0;

        while (i < s.length()) {
            size_t j = s.find(kDelimiter, i);
            if (j == std::string::npos) {
                throw std::invalid_argument("decode: missing '#' after length at offset " + std::to_string(i));
            }
            if (j == i) {
                throw std::invalid_argument("decode: empty length at offset " + std::to_string(i));
            }

            size_t length = 0;
            for (size_t k = i; k < j; ++k) {
                if (s[k] < '0' || s[k] > '9') {
                    throw std::invalid_argument("decode: bad length digit at offset " + std::to_string(k));
                }
                length = length * 10 + static_cast<size_t>(s[k] - '0');
                // Anything longer than the buffer is truncated input; stop before size_t can wrap
                if (length > s.length()) {
                    break;
                }
            }

            size_t payload_start = j + 1;
            if (length > s.length() - payload_start) {
                throw std::invalid_argument("decode: length " + s.substr(i, j - i) + " at offset " +
                                            std::to_string(i) + " runs past end of input");
            }

            decoded_strs.push_back(s.substr(payload_start, length));
            i = payload_start + length;
        }

        return decoded_strs;
    }

private:
    static constexpr char kDelimiter = '#';
};

} // namespace encode_and_decode_strings
} // namespace leetcode

#endif // LEETCODE_271_ENCODE_AND_DECODE_STRINGS_H
