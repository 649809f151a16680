#ifndef BASE64_HPP
#define BASE64_HPP

#include <cstdint>
#include <string>
#include <vector>

// Standard base64 (RFC 4648 alphabet, '=' padding). Board fields cross the
// command line and JSON views in this form.
class Base64 {
public:
    static std::string encode(const uint8_t* data, size_t length);
    static std::string encode(const std::vector<uint8_t>& bytes) { return encode(bytes.data(), bytes.size()); }

    // Throws InvalidEncoding. Leading and trailing whitespace is ignored.
    static std::vector<uint8_t> decode(const std::string& text);

private:
    static char toChar(uint8_t b6);
    static int fromChar(char ch);  // -1 if not in the alphabet
};

#endif // BASE64_HPP
