#include <gtest/gtest.h>
#include <core/utils.hpp>

static const std::string FFFD = "\xEF\xBF\xBD";

TEST(ParseInt, AcceptsPlainNumbers) {
    EXPECT_EQ(parse_int("22"), 22);
    EXPECT_EQ(parse_int(" 180 "), 180);
    EXPECT_EQ(parse_int("-1"), -1);
}

TEST(ParseInt, RejectsGarbage) {
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("abc").has_value());
    EXPECT_FALSE(parse_int("15s").has_value());
    EXPECT_FALSE(parse_int("99999999999").has_value());
}

TEST(ShellQuote, WrapsInSingleQuotes) {
    EXPECT_EQ(shell_quote("/opt/nbot"), "'/opt/nbot'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellQuote, EscapesEmbeddedQuotes) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(ShellQuote, LeavesMetacharactersInert) {
    EXPECT_EQ(shell_quote("$(rm -rf /); echo"), "'$(rm -rf /); echo'");
}

TEST(DecodeUtf8, PassesValidTextThrough) {
    EXPECT_EQ(decode_utf8_lossy("OK\n"), "OK\n");
    EXPECT_EQ(decode_utf8_lossy("caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x90\xB3"),
              "caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x90\xB3");
    EXPECT_EQ(decode_utf8_lossy(""), "");
}

TEST(DecodeUtf8, ReplacesStrayBytes) {
    EXPECT_EQ(decode_utf8_lossy("a\xFF" "b"), "a" + FFFD + "b");
    EXPECT_EQ(decode_utf8_lossy("\x80\x80"), FFFD + FFFD);
}

TEST(DecodeUtf8, ReplacesTruncatedSequenceOnce) {
    // Lead byte of a 3-byte sequence plus one valid continuation, then ASCII
    EXPECT_EQ(decode_utf8_lossy("x\xE2\x9C" "y"), "x" + FFFD + "y");
    // Truncated at end of input
    EXPECT_EQ(decode_utf8_lossy("end\xF0\x9F\x90"), "end" + FFFD);
}

TEST(DecodeUtf8, RejectsOverlongAndSurrogates) {
    EXPECT_EQ(decode_utf8_lossy("\xC0\xAF"), FFFD + FFFD);
    EXPECT_EQ(decode_utf8_lossy("\xED\xA0\x80"), FFFD + FFFD + FFFD);
    EXPECT_EQ(decode_utf8_lossy("\xF4\x90\x80\x80"), FFFD + FFFD + FFFD + FFFD);
}

TEST(DecodeUtf8, KeepsEmbeddedNul) {
    std::string bytes("a\0b", 3);
    EXPECT_EQ(decode_utf8_lossy(bytes), bytes);
}
