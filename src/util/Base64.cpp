#include "cmlink/util/Base64.hpp"

#include <cstdint>

namespace cmlink::util {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string base64Encode(std::string_view input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(kAlphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(kAlphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::optional<std::string> base64Decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }
    std::size_t padding = 0;
    while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=') {
        ++padding;
    }

    std::string output;
    output.reserve(input.size() / 4 * 3);
    std::uint32_t value = 0;
    int bitCount = -8;
    for (std::size_t i = 0; i < input.size() - padding; ++i) {
        int digit = decodeChar(input[i]);
        if (digit < 0) {
            return std::nullopt;
        }
        value = (value << 6) | static_cast<std::uint32_t>(digit);
        bitCount += 6;
        if (bitCount >= 0) {
            output.push_back(static_cast<char>((value >> bitCount) & 0xFF));
            bitCount -= 8;
        }
    }
    return output;
}

} // namespace cmlink::util
