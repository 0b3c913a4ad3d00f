#include <gtest/gtest.h>
#include "../services/dispatch/include/content_validator.hpp"
#include <string>

namespace {
// n characters, `bad` of which are \x01, the rest 'a'.
std::string mixed(std::size_t n, std::size_t bad) {
    std::string s(n, 'a');
    for (std::size_t i = 0; i < bad; ++i) s[i * (n / bad)] = '\x01';
    return s;
}
}

TEST(ContentValidatorTest, RejectsEmptyAndWhitespace) {
    EXPECT_EQ(validate_content(""), "empty content");
    EXPECT_EQ(validate_content(" \t\r\n  \n"), "empty content");
}

TEST(ContentValidatorTest, RejectsOversizedContent) {
    std::string big(kMaxRemoteContentBytes + 1, 'x');
    EXPECT_EQ(validate_content(big), "too large for remote call");

    std::string limit(kMaxRemoteContentBytes, 'x');
    EXPECT_FALSE(validate_content(limit).has_value());
}

TEST(ContentValidatorTest, RejectsNullByte) {
    std::string s = "package main\n";
    s.push_back('\0');
    s += "func main() {}\n";
    EXPECT_EQ(validate_content(s), "binary content");
}

TEST(ContentValidatorTest, RejectsTenPercentNonPrintable) {
    EXPECT_EQ(validate_content(mixed(1000, 100)), "non-text content");
}

TEST(ContentValidatorTest, ThresholdIsInclusive) {
    EXPECT_EQ(validate_content(mixed(1000, 50)), "non-text content");
    EXPECT_FALSE(validate_content(mixed(1000, 49)).has_value());
}

TEST(ContentValidatorTest, AcceptsOrdinarySource) {
    std::string src = "#include <cstdio>\n\nint main() {\n\tstd::puts(\"hi\");\r\n\treturn 0;\n}\n";
    EXPECT_FALSE(validate_content(src).has_value());
}

TEST(ContentValidatorTest, CountsUtf8SequenceAsOneCharacter) {
    // 30 two-byte characters in 1000 ASCII ones: 3% by characters, 6% by bytes.
    std::string s(1000, 'a');
    for (int i = 0; i < 30; ++i) s += "\xC3\xA9";
    EXPECT_FALSE(validate_content(s).has_value());
}

TEST(ContentValidatorTest, OrphanContinuationBytesAreNonText) {
    EXPECT_EQ(validate_content("a" + std::string(1000, '\x80')), "non-text content");
    EXPECT_EQ(validate_content(std::string(100, 'a') + std::string(200, '\xBF')), "non-text content");
}

TEST(ContentValidatorTest, TruncatedSequenceCountsOnce) {
    // 4-byte lead cut short after one continuation byte, then plain ASCII resumes.
    std::string s(900, 'a');
    for (int i = 0; i < 100; ++i) s += "\xF0\x9F" "b";
    EXPECT_EQ(validate_content(s), "non-text content");

    // 2% truncated sequences stay under the threshold.
    std::string ok(980, 'a');
    for (int i = 0; i < 20; ++i) ok += "\xE2\x82" "c";
    EXPECT_FALSE(validate_content(ok).has_value());
}

TEST(ContentValidatorTest, SurplusContinuationAfterValidSequence) {
    // Each "\xC3\xA9" is one character; the extra "\xA9" is a stray byte.
    std::string s(1000, 'a');
    for (int i = 0; i < 30; ++i) s += "\xC3\xA9\xA9";
    EXPECT_EQ(validate_content(s), "non-text content");
}

TEST(ContentValidatorTest, EmptyCheckRunsFirst) {
    std::string s(kMaxRemoteContentBytes + 10, ' ');
    EXPECT_EQ(validate_content(s), "empty content");
}
