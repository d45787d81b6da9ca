/**
 * @file string_utils_test.cpp
 * @brief Tests for string helpers, byte sizes and output decoding
 *
 * @date 2025
 */

#include <gtest/gtest.h>

#include "warden/utils/string_utils.hpp"

using warden::utils::DecodeError;
using warden::utils::DecodeErrors;
using warden::utils::StringUtils;

TEST(StringUtils, TrimSplitJoin) {
    EXPECT_EQ(StringUtils::Trim("  \tvalue \n"), "value");
    EXPECT_EQ(StringUtils::Trim("   "), "");

    auto parts = StringUtils::Split("0-3,,5,", ',');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "0-3");
    EXPECT_EQ(parts[1], "5");

    EXPECT_EQ(StringUtils::Join({"python3", "-c", "pass"}, " "), "python3 -c pass");
    EXPECT_EQ(StringUtils::Join({}, " "), "");
    EXPECT_TRUE(StringUtils::StartsWith("warden-abc", "warden-"));
    EXPECT_FALSE(StringUtils::StartsWith("war", "warden-"));
}

TEST(StringUtils, ParseByteSize) {
    EXPECT_EQ(StringUtils::ParseByteSize("512"), 512);
    EXPECT_EQ(StringUtils::ParseByteSize("512b"), 512);
    EXPECT_EQ(StringUtils::ParseByteSize("64k"), 64 * 1024);
    EXPECT_EQ(StringUtils::ParseByteSize("100M"), 100LL * 1024 * 1024);
    EXPECT_EQ(StringUtils::ParseByteSize(" 4g "), 4LL * 1024 * 1024 * 1024);

    EXPECT_THROW(StringUtils::ParseByteSize(""), std::invalid_argument);
    EXPECT_THROW(StringUtils::ParseByteSize("g"), std::invalid_argument);
    EXPECT_THROW(StringUtils::ParseByteSize("-1"), std::invalid_argument);
    EXPECT_THROW(StringUtils::ParseByteSize("1.5g"), std::invalid_argument);
    EXPECT_THROW(StringUtils::ParseByteSize("99999999999999999999g"), std::invalid_argument);
}

TEST(StringUtils, RandomHex) {
    auto a = StringUtils::RandomHex(24);
    auto b = StringUtils::RandomHex(24);
    EXPECT_EQ(a.size(), 24u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(a, b);
}

TEST(StringUtils, CanonicalEncoding) {
    EXPECT_EQ(StringUtils::CanonicalEncoding("UTF_8"), "utf-8");
    EXPECT_EQ(StringUtils::CanonicalEncoding("utf8"), "utf-8");
    EXPECT_EQ(StringUtils::CanonicalEncoding("US-ASCII"), "ascii");
    EXPECT_EQ(StringUtils::CanonicalEncoding("ISO-8859-1"), "latin-1");
    EXPECT_THROW(StringUtils::CanonicalEncoding("ebcdic"), std::invalid_argument);
}

TEST(StringUtils, ParseDecodeErrors) {
    EXPECT_EQ(StringUtils::ParseDecodeErrors("strict"), DecodeErrors::STRICT);
    EXPECT_EQ(StringUtils::ParseDecodeErrors("Replace"), DecodeErrors::REPLACE);
    EXPECT_EQ(StringUtils::ParseDecodeErrors("ignore"), DecodeErrors::IGNORE);
    EXPECT_EQ(StringUtils::ParseDecodeErrors("backslashreplace"), DecodeErrors::BACKSLASH_REPLACE);
    EXPECT_THROW(StringUtils::ParseDecodeErrors("surrogateescape"), std::invalid_argument);
}

TEST(StringUtils, DecodeValidUtf8) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(StringUtils::Decode(text, "utf-8", DecodeErrors::STRICT), text);
}

TEST(StringUtils, DecodeStrictReportsOffset) {
    try {
        StringUtils::Decode("ok\xFFtail", "utf-8", DecodeErrors::STRICT);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.Offset(), 2u);
        EXPECT_EQ(e.Encoding(), "utf-8");
    }
}

TEST(StringUtils, DecodeErrorPolicies) {
    const std::string bytes = "a\xFF" "b";
    EXPECT_EQ(StringUtils::Decode(bytes, "utf-8", DecodeErrors::REPLACE), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(StringUtils::Decode(bytes, "utf-8", DecodeErrors::IGNORE), "ab");
    EXPECT_EQ(StringUtils::Decode(bytes, "utf-8", DecodeErrors::BACKSLASH_REPLACE), "a\\xffb");
}

TEST(StringUtils, DecodeRejectsOverlongAndSurrogates) {
    // Overlong '/' and an encoded surrogate half.
    EXPECT_THROW(StringUtils::Decode("\xC0\xAF", "utf-8", DecodeErrors::STRICT), DecodeError);
    EXPECT_THROW(StringUtils::Decode("\xED\xA0\x80", "utf-8", DecodeErrors::STRICT), DecodeError);
}

TEST(StringUtils, DecodeTruncatedSequenceIsOneReplacement) {
    EXPECT_EQ(StringUtils::Decode("x\xE2\x82", "utf-8", DecodeErrors::REPLACE), "x\xEF\xBF\xBD");
}

TEST(StringUtils, DecodeAsciiAndLatin1) {
    EXPECT_THROW(StringUtils::Decode("caf\xE9", "ascii", DecodeErrors::STRICT), DecodeError);
    EXPECT_EQ(StringUtils::Decode("caf\xE9", "ascii", DecodeErrors::REPLACE), "caf\xEF\xBF\xBD");
    EXPECT_EQ(StringUtils::Decode("caf\xE9", "latin-1", DecodeErrors::STRICT), "caf\xC3\xA9");
}
