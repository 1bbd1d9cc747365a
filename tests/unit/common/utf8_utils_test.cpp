#include <gtest/gtest.h>
#include <regix/common/utf8_utils.h>

using namespace regix::common;

TEST(Utf8UtilsTest, CodePointCountCountsHangulOnce) {
    EXPECT_EQ(codePointCount(""), 0u);
    EXPECT_EQ(codePointCount("abc"), 3u);
    EXPECT_EQ(codePointCount("클라우드"), 4u);
    EXPECT_EQ(codePointCount("AWS 보안"), 6u);
}

TEST(Utf8UtilsTest, ToLowerAsciiLeavesMultiByteUntouched) {
    EXPECT_EQ(toLowerAscii("ISMS-P 인증"), "isms-p 인증");
    EXPECT_EQ(toLowerAscii("Cloud"), "cloud");
}

TEST(Utf8UtilsTest, SplitWhitespaceDropsEmptyTokens) {
    auto tokens = splitWhitespace("  a\tbb \n 클라우드  ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "a");
    EXPECT_EQ(tokens[1], "bb");
    EXPECT_EQ(tokens[2], "클라우드");
    EXPECT_TRUE(splitWhitespace("   ").empty());
}

TEST(Utf8UtilsTest, ContainsWholeWordRespectsBoundaries) {
    EXPECT_TRUE(containsWholeWord("move to the cloud now", "cloud"));
    EXPECT_TRUE(containsWholeWord("cloud", "cloud"));
    EXPECT_TRUE(containsWholeWord("(cloud)", "cloud"));
    EXPECT_FALSE(containsWholeWord("cloudnative", "cloud"));
    EXPECT_FALSE(containsWholeWord("my_cloud", "cloud"));
    EXPECT_FALSE(containsWholeWord("anything", ""));
}

TEST(Utf8UtilsTest, HangulParticleIsPartOfTheWord) {
    // "보안을" is one word, so "보안" only matches as a substring
    EXPECT_FALSE(containsWholeWord("보안을 강화", "보안"));
    EXPECT_TRUE(containsWholeWord("보안 강화", "보안"));
}

TEST(Utf8UtilsTest, LaterOccurrenceCanSatisfyBoundary) {
    EXPECT_TRUE(containsWholeWord("cloudy cloud", "cloud"));
}

TEST(Utf8UtilsTest, SplitWhitespaceHandlesUnicodeSpaces) {
    // U+3000 ideographic space and U+00A0 no-break space
    auto tokens = splitWhitespace("보안　cloud 정책");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "보안");
    EXPECT_EQ(tokens[1], "cloud");
    EXPECT_EQ(tokens[2], "정책");
    EXPECT_TRUE(splitWhitespace("　  ").empty());
}

TEST(Utf8UtilsTest, WordCodePointClassification) {
    EXPECT_TRUE(isWordCodePoint(U'a'));
    EXPECT_TRUE(isWordCodePoint(U'_'));
    EXPECT_TRUE(isWordCodePoint(U'보'));
    EXPECT_TRUE(isWordCodePoint(U'é'));
    EXPECT_FALSE(isWordCodePoint(U'-'));
    EXPECT_FALSE(isWordCodePoint(U'·')); // middle dot
    EXPECT_FALSE(isWordCodePoint(U'“')); // left double quote
    EXPECT_FALSE(isWordCodePoint(U'…')); // ellipsis
    EXPECT_FALSE(isWordCodePoint(U'「')); // corner bracket
    EXPECT_FALSE(isWordCodePoint(U'　'));
    EXPECT_FALSE(isWordCodePoint(U'，')); // fullwidth comma
}

TEST(Utf8UtilsTest, ReplacePunctuationKeepsWordsAndSpaces) {
    EXPECT_EQ(replacePunctuation("클라우드·보안 정책"), "클라우드 보안 정책");
    EXPECT_EQ(replacePunctuation("「cloud」…"), " cloud  ");
    EXPECT_EQ(replacePunctuation("a-b_c"), "a b_c");
}

TEST(Utf8UtilsTest, UnicodePunctuationIsAWordBoundary) {
    EXPECT_TRUE(containsWholeWord("the “cloud” platform", "cloud"));
    EXPECT_TRUE(containsWholeWord("보안　cloud", "cloud"));
    EXPECT_TRUE(containsWholeWord("클라우드·보안", "보안"));
    EXPECT_FALSE(containsWholeWord("클라우드보안", "보안"));
}

TEST(Utf8UtilsTest, MalformedBytesDecodeAsReplacement) {
    size_t length = 0;
    EXPECT_EQ(decodeCodePoint("\xE2\x80", 0, length), U'�');
    EXPECT_EQ(length, 1u);
    EXPECT_EQ(decodeCodePoint("\xEB\xB3\xB4", 0, length), U'보');
    EXPECT_EQ(length, 3u);
    EXPECT_EQ(codePointCount("cloud\xE2\x80"), 6u);
}
