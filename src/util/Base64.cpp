/**
 * Base64.cpp - RFC 4648 base64
 */

#include "vtc/util/Base64.hpp"

namespace vtc::util {

namespace {

const char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string base64Encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += ALPHABET[n & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = data[i] << 16;
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

std::optional<std::vector<uint8_t>> base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        int v[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the last quad
                if (i + 4 != text.size() || k < 2) return std::nullopt;
                v[k] = 0;
                ++padding;
            } else {
                if (padding > 0) return std::nullopt;
                v[k] = decodeChar(c);
                if (v[k] < 0) return std::nullopt;
            }
        }

        uint32_t n = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }

    return out;
}

} // namespace vtc::util
