#include "Base64.hpp"
#include "Errors.hpp"
#include <cctype>

char Base64::toChar(uint8_t b6) {
    if (b6 < 26) {
        return static_cast<char>('A' + b6);
    } else if (b6 < 52) {
        return static_cast<char>('a' + b6 - 26);
    } else if (b6 < 62) {
        return static_cast<char>('0' + b6 - 52);
    } else if (b6 == 62) {
        return '+';
    }
    return '/';
}

int Base64::fromChar(char ch) {
    if (ch >= 'A' && ch <= 'Z') {
        return ch - 'A';
    } else if (ch >= 'a' && ch <= 'z') {
        return 26 + ch - 'a';
    } else if (ch >= '0' && ch <= '9') {
        return 52 + ch - '0';
    } else if (ch == '+') {
        return 62;
    } else if (ch == '/') {
        return 63;
    }
    return -1;
}

std::string Base64::encode(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve((length + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= length; i += 3) {
        uint32_t chunk = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += toChar((chunk >> 18) & 0x3F);
        out += toChar((chunk >> 12) & 0x3F);
        out += toChar((chunk >> 6) & 0x3F);
        out += toChar(chunk & 0x3F);
    }

    size_t rest = length - i;
    if (rest == 1) {
        uint32_t chunk = uint32_t(data[i]) << 16;
        out += toChar((chunk >> 18) & 0x3F);
        out += toChar((chunk >> 12) & 0x3F);
        out += "==";
    } else if (rest == 2) {
        uint32_t chunk = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += toChar((chunk >> 18) & 0x3F);
        out += toChar((chunk >> 12) & 0x3F);
        out += toChar((chunk >> 6) & 0x3F);
        out += '=';
    }

    return out;
}

std::vector<uint8_t> Base64::decode(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;

    size_t length = end - begin;
    if (length % 4 != 0) {
        throw InvalidEncoding("length " + std::to_string(length) + " is not a multiple of 4");
    }

    std::vector<uint8_t> out;
    out.reserve(length / 4 * 3);

    for (size_t pos = begin; pos < end; pos += 4) {
        bool lastQuad = (pos + 4 == end);
        int values[4];
        int padding = 0;

        for (int k = 0; k < 4; k++) {
            char ch = text[pos + k];
            if (ch == '=') {
                // Padding only in the last two slots of the final quad
                if (!lastQuad || k < 2) {
                    throw InvalidEncoding("misplaced padding at offset " + std::to_string(pos + k - begin));
                }
                padding++;
                values[k] = 0;
                continue;
            }
            if (padding > 0) {
                throw InvalidEncoding("data after padding at offset " + std::to_string(pos + k - begin));
            }
            values[k] = fromChar(ch);
            if (values[k] < 0) {
                throw InvalidEncoding("unexpected character '" + std::string(1, ch) + "' at offset " +
                                      std::to_string(pos + k - begin));
            }
        }

        uint32_t chunk = (uint32_t(values[0]) << 18) | (uint32_t(values[1]) << 12) |
                         (uint32_t(values[2]) << 6) | uint32_t(values[3]);
        out.push_back(static_cast<uint8_t>(chunk >> 16));
        if (padding < 2) {
            out.push_back(static_cast<uint8_t>(chunk >> 8));
        }
        if (padding < 1) {
            out.push_back(static_cast<uint8_t>(chunk));
        }
    }

    return out;
}
