#include <gtest/gtest.h>
#include "options_ngin/sentiment/text_utils.hpp"

using namespace options_ngin::sentiment;

class TextUtilsTest : public ::testing::Test {};

TEST_F(TextUtilsTest, StripsTagsAndDecodesEntities) {
    EXPECT_EQ(normalize_headline("<b>Apple</b> beats &amp; raises"), "Apple beats & raises");
    EXPECT_EQ(normalize_headline("Analyst says &quot;buy&quot; &lt;AAPL&gt;"),
              "Analyst says \"buy\" <AAPL>");
    EXPECT_EQ(normalize_headline("S&amp;P&nbsp;500 at record"), "S&P 500 at record");
    EXPECT_EQ(normalize_headline("Fed&#39;s path"), "Fed's path");
}

TEST_F(TextUtilsTest, CollapsesWhitespace) {
    EXPECT_EQ(normalize_headline("  Markets\t\trally \n into   close  "),
              "Markets rally into close");
    EXPECT_EQ(normalize_headline("   "), "");
    EXPECT_EQ(normalize_headline(""), "");
}

TEST_F(TextUtilsTest, TruncatesOnCharacterBoundary) {
    EXPECT_EQ(normalize_headline("abcdef ghij", 7), "abcdef");

    // "é" is two bytes; cutting after byte 2 would split it
    std::string accented = "ab\xC3\xA9" "cd";
    EXPECT_EQ(normalize_headline(accented, 3), "ab");
    EXPECT_EQ(normalize_headline(accented, 4), "ab\xC3\xA9");
}

TEST_F(TextUtilsTest, TokenizeLowercasesAndSplits) {
    auto tokens = tokenize("Apple's Q3 BEATS estimates, shares up 5%!");
    std::vector<std::string> expected = {"apple's", "q3", "beats", "estimates",
                                         "shares", "up",  "5"};
    EXPECT_EQ(tokens, expected);
}

TEST_F(TextUtilsTest, TokenizeDropsQuoteMarks) {
    auto tokens = tokenize("Analyst keeps 'Buy' rating, doesn't expect ''");
    std::vector<std::string> expected = {"analyst", "keeps", "buy", "rating", "doesn't",
                                         "expect"};
    EXPECT_EQ(tokens, expected);
    EXPECT_TRUE(tokenize("... --- !!!").empty());
}
