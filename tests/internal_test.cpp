// Unit tests for pagekey/internal.hpp utilities
// Tests: base32, UTF-8 encoding, hex parsing, string helpers

#include <gtest/gtest.h>

#include <pagekey/internal.hpp>

#include <string>
#include <vector>

namespace pagekey::internal {
namespace {

// =============================================================================
// Base32 Tests
// =============================================================================

class Base32Test : public ::testing::Test {};

TEST_F(Base32Test, Rfc4648VectorsWithPadding) {
  EXPECT_EQ(Base32Encode(""), "");
  EXPECT_EQ(Base32Encode("f"), "MY======");
  EXPECT_EQ(Base32Encode("fo"), "MZXQ====");
  EXPECT_EQ(Base32Encode("foo"), "MZXW6===");
  EXPECT_EQ(Base32Encode("foob"), "MZXW6YQ=");
  EXPECT_EQ(Base32Encode("fooba"), "MZXW6YTB");
  EXPECT_EQ(Base32Encode("foobar"), "MZXW6YTBOI======");
}

TEST_F(Base32Test, DecodeInvertsEncode) {
  const std::vector<std::string> inputs = {"", "f", "foobar", "my_page", "东京",
                                          std::string("\0\xff", 2)};
  for (const auto& input : inputs) {
    std::string decoded;
    ASSERT_TRUE(Base32Decode(Base32Encode(input), &decoded).ok()) << input;
    EXPECT_EQ(decoded, input);
  }
}

TEST_F(Base32Test, DecodeAcceptsPaddedAndUnpaddedInput) {
  std::string decoded;
  ASSERT_TRUE(Base32Decode("MZXW6===", &decoded).ok());
  EXPECT_EQ(decoded, "foo");
  ASSERT_TRUE(Base32Decode("MZXW6", &decoded).ok());
  EXPECT_EQ(decoded, "foo");
  EXPECT_TRUE(Base32Decode("MZ=XW6", &decoded).IsInvalidArgument());
}

TEST_F(Base32Test, DecodeRejectsForeignCharacters) {
  std::string decoded;
  EXPECT_TRUE(Base32Decode("mzxw6", &decoded).IsInvalidArgument());
  EXPECT_TRUE(Base32Decode("MZ1W6", &decoded).IsInvalidArgument());
  EXPECT_TRUE(Base32Decode("MZ W6", &decoded).IsInvalidArgument());
}

TEST_F(Base32Test, DecodeRejectsImpossibleLengthsAndTrailingBits) {
  std::string decoded;
  EXPECT_TRUE(Base32Decode("M", &decoded).IsInvalidArgument());
  EXPECT_TRUE(Base32Decode("MZX", &decoded).IsInvalidArgument());
  // "MZ" is canonical for "f"; "M7" sets bits past the last byte
  EXPECT_TRUE(Base32Decode("M7", &decoded).IsInvalidArgument());
}

// =============================================================================
// UTF-8 and hex helpers
// =============================================================================

class EncodingHelpersTest : public ::testing::Test {};

TEST_F(EncodingHelpersTest, AppendUtf8CoversAllLengths) {
  std::string out;
  EXPECT_TRUE(AppendUtf8(0x41, &out));
  EXPECT_TRUE(AppendUtf8(0xE9, &out));
  EXPECT_TRUE(AppendUtf8(0x6771, &out));
  EXPECT_TRUE(AppendUtf8(0x1F642, &out));
  EXPECT_EQ(out, "A\xC3\xA9\xE6\x9D\xB1\xF0\x9F\x99\x82");
}

TEST_F(EncodingHelpersTest, AppendUtf8RejectsSurrogatesAndOutOfRange) {
  std::string out;
  EXPECT_FALSE(AppendUtf8(0xD800, &out));
  EXPECT_FALSE(AppendUtf8(0x110000, &out));
  EXPECT_TRUE(out.empty());
}

TEST_F(EncodingHelpersTest, ParseHex) {
  uint32_t v = 0;
  EXPECT_TRUE(ParseHex("u00e9", 1, 4, &v));
  EXPECT_EQ(v, 0xE9u);
  EXPECT_TRUE(ParseHex("0001F642", 0, 8, &v));
  EXPECT_EQ(v, 0x1F642u);
  EXPECT_FALSE(ParseHex("00g0", 0, 4, &v));
  EXPECT_FALSE(ParseHex("00", 0, 4, &v));
}

TEST_F(EncodingHelpersTest, TrimViewAndStartsWith) {
  EXPECT_EQ(TrimView("  a b \r\n"), "a b");
  EXPECT_EQ(TrimView(" \t "), "");
  EXPECT_TRUE(StartsWith("+++\n", "+++"));
  EXPECT_FALSE(StartsWith("++", "+++"));
}

TEST_F(EncodingHelpersTest, Utf8ToLowerIsPerCodePoint) {
  EXPECT_EQ(Utf8ToLower("MyPage"), "mypage");
  EXPECT_EQ(Utf8ToLower("ÉCOLE"), "école");
  EXPECT_EQ(Utf8ToLower("ПРИВЕТ"), "привет");
  EXPECT_EQ(Utf8ToLower("东京"), "东京");
}

TEST_F(EncodingHelpersTest, RetryableTransactionStatuses) {
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::Busy()));
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::TimedOut()));
  EXPECT_TRUE(IsRetryableTxnStatus(rocksdb::Status::TryAgain()));
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::NotFound()));
  EXPECT_FALSE(IsRetryableTxnStatus(rocksdb::Status::IOError()));
}

}  // namespace
}  // namespace pagekey::internal
