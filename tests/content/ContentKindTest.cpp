#include <gtest/gtest.h>
#include <mindarbor/content/ContentKind.h>

#include <string>

using namespace mindarbor;

// --- Formula detection ---

TEST(ContentKindTest, Formula_SingleLine) {
    EXPECT_TRUE(isFormulaContent("$$x^2 + y^2$$"));
}

TEST(ContentKindTest, Formula_MultiLineWithSurroundingWhitespace) {
    EXPECT_TRUE(isFormulaContent("  $$\n\\frac{a}{b}\n$$\n"));
}

TEST(ContentKindTest, Formula_WithFromLinkAnnotation) {
    EXPECT_TRUE(isFormulaContent("$$E = mc^2$$ <!-- fromLink:node-42 -->"));
}

TEST(ContentKindTest, Formula_RejectsTrailingText) {
    EXPECT_FALSE(isFormulaContent("$$x$$ and more"));
    EXPECT_FALSE(isFormulaContent("see $$x$$"));
    EXPECT_FALSE(isFormulaContent("$$unterminated"));
    EXPECT_FALSE(isFormulaContent(""));
}

TEST(ContentKindTest, Formula_LaterClosingDelimiterAccepted) {
    EXPECT_TRUE(isFormulaContent("$$a$$b$$"));
    EXPECT_TRUE(isFormulaContent("$$a$$ <!-- fromLink:x --> $$ <!-- fromLink:y -->"));
    EXPECT_TRUE(isFormulaContent("$$$$"));
    EXPECT_FALSE(isFormulaContent("$$$"));
    EXPECT_FALSE(isFormulaContent("$$x$$ <!-- fromLink:"));
    EXPECT_FALSE(isFormulaContent("$$x$$ <!-- other -->"));
}

TEST(ContentKindTest, Formula_UnicodeWhitespaceTrimmed) {
    EXPECT_TRUE(isFormulaContent("$$x^2$$\xC2\xA0"));
    EXPECT_TRUE(isFormulaContent("\xE3\x80\x80$$x^2$$"));
    EXPECT_TRUE(isFormulaContent("$$x$$\xC2\xA0<!-- fromLink:n1 -->\xE3\x80\x80"));
}

TEST(ContentKindTest, Formula_VeryLongContent) {
    const std::string body(1 << 20, 'x');
    EXPECT_TRUE(isFormulaContent("$$" + body + "$$"));
    EXPECT_TRUE(isFormulaContent("$$" + body + "$$ <!-- fromLink:node-1 -->"));
    EXPECT_FALSE(isFormulaContent("$$" + body));
    EXPECT_FALSE(isFormulaContent("$$" + body + "$$ tail"));
}

// --- Image detection ---

TEST(ContentKindTest, Image_WikiEmbed) {
    EXPECT_TRUE(isImageContent("![[diagram.png]]"));
    EXPECT_TRUE(isImageContent("[[Other note]]"));
}

TEST(ContentKindTest, Image_MarkdownLinkOrImage) {
    EXPECT_TRUE(isImageContent("![alt](images/a.png)"));
    EXPECT_TRUE(isImageContent("see [docs](https://example.com)"));
}

TEST(ContentKindTest, Image_PlainTextIsNotImage) {
    EXPECT_FALSE(isImageContent("just [brackets] here"));
    EXPECT_FALSE(isImageContent(""));
}

TEST(ContentKindTest, Image_LinkMustStayOnOneLine) {
    EXPECT_FALSE(isImageContent("[[split\nembed]]"));
    EXPECT_FALSE(isImageContent("[text\n](url)"));
    EXPECT_TRUE(isImageContent("first line\n[docs](url)"));
}

TEST(ContentKindTest, Image_UnclosedEmbedLongText) {
    const std::string filler(1 << 20, 'y');
    EXPECT_FALSE(isImageContent("[[" + filler));
    EXPECT_FALSE(isImageContent("[" + filler + "](" + filler));
    EXPECT_TRUE(isImageContent("[[" + filler + "]]"));
    EXPECT_TRUE(isImageContent(filler + "![alt](" + filler + ")"));
}

TEST(ContentKindTest, Classify_FormulaWinsOverImage) {
    EXPECT_EQ(classifyContent("$$[[x]]$$"), ContentKind::Formula);
    EXPECT_EQ(classifyContent("![[x.png]]"), ContentKind::Image);
    EXPECT_EQ(classifyContent("hello"), ContentKind::Text);
    EXPECT_STREQ(contentKindName(ContentKind::Image), "image");
}

// --- Text height estimation ---

TEST(ContentKindTest, EstimateHeight_EmptyTextClampsToMinimum) {
    EXPECT_FLOAT_EQ(estimateTextNodeHeight("", 400.0f), TextMetrics::MIN_NODE_HEIGHT);
}

TEST(ContentKindTest, EstimateHeight_SingleShortLine) {
    // 1 line * 26 + 44
    EXPECT_FLOAT_EQ(estimateTextNodeHeight("Hello", 400.0f), 70.0f);
}

TEST(ContentKindTest, EstimateHeight_BlankLineCountsHalf) {
    EXPECT_FLOAT_EQ(estimateTextNodeHeight("a\nb", 400.0f), 96.0f);
    // 2.5 lines -> 65 + 44
    EXPECT_FLOAT_EQ(estimateTextNodeHeight("a\n\nb", 400.0f), 109.0f);
}

TEST(ContentKindTest, EstimateHeight_LongLineWraps) {
    // 100 * 8.4px = 840px over 360px of content width -> 3 lines
    std::string line(100, 'x');
    EXPECT_FLOAT_EQ(estimateTextNodeHeight(line, 400.0f), 122.0f);
}

TEST(ContentKindTest, EstimateHeight_CjkCountsWider) {
    std::string cjk;
    for (int i = 0; i < 30; ++i) {
        cjk += "\xE4\xB8\x80";  // U+4E00
    }
    std::string latin(30, 'a');

    EXPECT_FLOAT_EQ(estimateTextNodeHeight(latin, 400.0f), 70.0f);
    EXPECT_FLOAT_EQ(estimateTextNodeHeight(cjk, 400.0f), 96.0f);
}

TEST(ContentKindTest, EstimateHeight_MarkdownMarkersIgnored) {
    std::string emphasis = std::string(60, '*') + "a";
    EXPECT_FLOAT_EQ(estimateTextNodeHeight(emphasis, 400.0f), 70.0f);
    EXPECT_FLOAT_EQ(estimateTextNodeHeight("## Heading", 400.0f), 70.0f);
}

TEST(ContentKindTest, EstimateHeight_ClampedToMaxHeight) {
    std::string text;
    for (int i = 0; i < 10; ++i) {
        text += "line\n";
    }
    EXPECT_FLOAT_EQ(estimateTextNodeHeight(text, 400.0f, 200.0f), 200.0f);
}
