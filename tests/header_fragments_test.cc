#include <gtest/gtest.h>

#include "header_fragments.h"

#include <string>

using namespace md_writer;

// -----------------------------------------------------------------------------
// Setext headers
// -----------------------------------------------------------------------------

TEST(SetextHeaderTest, H1ReturnsALevel1Header) {
    EXPECT_EQ(h1("Hello!"), "Hello!\n======");
}

TEST(SetextHeaderTest, H2ReturnsALevel2Header) {
    EXPECT_EQ(h2("Hello!"), "Hello!\n------");
}

TEST(SetextHeaderTest, UnderlineMatchesLongerText) {
    EXPECT_EQ(h1("Hello world!"), "Hello world!\n============");
    EXPECT_EQ(h2("Hello world!"), "Hello world!\n------------");
}

// Underline length counts code points, not bytes.
TEST(SetextHeaderTest, UnderlineCountsCodePoints) {
    EXPECT_EQ(h1("Gr\xC3\xB6\xC3\x9F" "e"), "Gr\xC3\xB6\xC3\x9F" "e\n=====");  // Größe
    EXPECT_EQ(h2("\xF0\x9F\x8E\x89 Party"), "\xF0\x9F\x8E\x89 Party\n-------");
}

TEST(SetextHeaderTest, EmptyTextHasEmptyUnderline) {
    EXPECT_EQ(h1(""), "\n");
    EXPECT_EQ(h2(""), "\n");
}

// -----------------------------------------------------------------------------
// ATX headers
// -----------------------------------------------------------------------------

TEST(AtxHeaderTest, H3ReturnsALevel3Header) {
    EXPECT_EQ(h3("Hello!"), "### Hello!");
}

TEST(AtxHeaderTest, H4ReturnsALevel4Header) {
    EXPECT_EQ(h4("Hello!"), "#### Hello!");
}

TEST(AtxHeaderTest, H5ReturnsALevel5Header) {
    EXPECT_EQ(h5("Hello!"), "##### Hello!");
}

TEST(AtxHeaderTest, H6ReturnsALevel6Header) {
    EXPECT_EQ(h6("Hello!"), "###### Hello!");
}

// Text is concatenated as-is, trailing characters included.
TEST(AtxHeaderTest, TextIsUnmodified) {
    EXPECT_EQ(h3(""), "### ");
    EXPECT_EQ(h4("  spaced  #"), "####   spaced  #");
}
