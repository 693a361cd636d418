#include <gtest/gtest.h>

#include "font_metrics.h"

using namespace DocBinder;

TEST(FontMetrics, HelveticaWidths) {
    EXPECT_EQ(glyph_width(FontFace::Regular, ' '), 278);
    EXPECT_EQ(glyph_width(FontFace::Regular, 'A'), 667);
    EXPECT_EQ(glyph_width(FontFace::Regular, 'i'), 222);
    EXPECT_EQ(glyph_width(FontFace::Bold, 'i'), 278);
    EXPECT_EQ(glyph_width(FontFace::Regular, '0'), 556);
    EXPECT_STREQ(font_base_name(FontFace::Bold), "Helvetica-Bold");
}

TEST(FontMetrics, TextWidthScalesWithSize) {
    // "001": three digits of 556
    EXPECT_NEAR(text_width("001", FontFace::Regular, 10), 16.68, 1e-9);
    EXPECT_NEAR(text_width("001", FontFace::Regular, 20), 2 * text_width("001", FontFace::Regular, 10), 1e-9);
    EXPECT_DOUBLE_EQ(text_width("", FontFace::Bold, 12), 0.0);
}

TEST(FontMetrics, WinAnsiConversion) {
    EXPECT_EQ(to_win_ansi("plain.pdf"), "plain.pdf");
    EXPECT_EQ(to_win_ansi("caf\xC3\xA9"), "caf\xE9");
    EXPECT_EQ(to_win_ansi("\xE2\x82\xAC"), "\x80");
    // CJK is outside the code page
    EXPECT_EQ(to_win_ansi("\xE6\x96\x87"), "?");
    // Truncated sequence
    EXPECT_EQ(to_win_ansi("a\xC3"), "a?");
}

TEST(FontMetrics, ShortTextIsOneLine) {
    std::vector<std::string> lines = wrap_text("    1.1 - c.pdf", FontFace::Regular, 11, 400);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "    1.1 - c.pdf");
}

TEST(FontMetrics, LongTextWrapsAtSpaces) {
    std::string text = "1 - a rather long document name that cannot possibly fit on one line.pdf";
    std::vector<std::string> lines = wrap_text(text, FontFace::Regular, 11, 150);

    ASSERT_GT(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("1 - ", 0), 0u);
    std::string joined;
    for (const auto& line : lines) {
        EXPECT_LE(text_width(line, FontFace::Regular, 11), 150.0);
        if (!joined.empty()) joined += " ";
        joined += line;
    }
    EXPECT_EQ(joined, text);
}

TEST(FontMetrics, OverlongWordIsBrokenByCharacter) {
    std::string word(80, 'W');
    std::vector<std::string> lines = wrap_text(word, FontFace::Bold, 24, 200);

    ASSERT_GT(lines.size(), 1u);
    std::string joined;
    for (const auto& line : lines) {
        EXPECT_LE(text_width(line, FontFace::Bold, 24), 200.0);
        joined += line;
    }
    EXPECT_EQ(joined, word);
}
