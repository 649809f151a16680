#include <gtest/gtest.h>
#include "Base64.hpp"
#include "BitBoard.hpp"
#include "Errors.hpp"
#include <string>
#include <vector>

static std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(Base64Test, KnownVectors) {
    // RFC 4648 test vectors
    EXPECT_EQ(Base64::encode(bytesOf("")), "");
    EXPECT_EQ(Base64::encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(Base64::encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(Base64::encode(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(Base64::encode(bytesOf("foob")), "Zm9vYg==");
    EXPECT_EQ(Base64::encode(bytesOf("fooba")), "Zm9vYmE=");
    EXPECT_EQ(Base64::encode(bytesOf("foobar")), "Zm9vYmFy");

    EXPECT_EQ(Base64::decode("Zg=="), bytesOf("f"));
    EXPECT_EQ(Base64::decode("Zm8="), bytesOf("fo"));
    EXPECT_EQ(Base64::decode("Zm9vYmFy"), bytesOf("foobar"));
}

TEST(Base64Test, FullAlphabet) {
    std::vector<uint8_t> bytes = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(Base64::encode(bytes), "+/+/");
    EXPECT_EQ(Base64::decode("+/+/"), bytes);
}

TEST(Base64Test, BoardField) {
    // Byte 0 = 24, the rest zero
    std::vector<uint8_t> field(BitBoard::FIELD_LEN, 0);
    field[0] = 24;
    std::string text = "GAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=";

    EXPECT_EQ(Base64::encode(field), text);
    EXPECT_EQ(Base64::decode(text), field);
}

TEST(Base64Test, IgnoresSurroundingWhitespace) {
    EXPECT_EQ(Base64::decode("  Zm9v\n"), bytesOf("foo"));
}

TEST(Base64Test, RejectsBadLength) {
    EXPECT_THROW(Base64::decode("Zm9"), InvalidEncoding);
    EXPECT_THROW(Base64::decode("Zm9vY"), InvalidEncoding);
}

TEST(Base64Test, RejectsBadCharacters) {
    EXPECT_THROW(Base64::decode("Zm9*"), InvalidEncoding);
    EXPECT_THROW(Base64::decode("Zm 9"), InvalidEncoding);
    EXPECT_THROW(Base64::decode("Zm-_"), InvalidEncoding);
}

TEST(Base64Test, RejectsMisplacedPadding) {
    EXPECT_THROW(Base64::decode("Z==="), InvalidEncoding);
    EXPECT_THROW(Base64::decode("Zm=v"), InvalidEncoding);
    EXPECT_THROW(Base64::decode("Zg==Zm9v"), InvalidEncoding);
}

TEST(Base64Test, EncodingErrorsAreInvalidArguments) {
    EXPECT_THROW(Base64::decode("!!!!"), std::invalid_argument);
}
