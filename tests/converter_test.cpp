#include <gtest/gtest.h>

#include "site.hpp"
#include "markdown_extensions.hpp"

using namespace mdblog;



static bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}



TEST(Converter, StandardMarkdown) {
    auto html = convert_markdown_to_html("# Hello\nWorld\n\n* one\n* two\n\n[link](http://example.com)\n");

    EXPECT_TRUE(contains(html, "<h1>Hello</h1>"));
    EXPECT_TRUE(contains(html, "World"));
    EXPECT_TRUE(contains(html, "<ul>"));
    EXPECT_TRUE(contains(html, "two"));
    EXPECT_TRUE(contains(html, "<a href=\"http://example.com\">link</a>"));
    EXPECT_FALSE(contains(html, "<html"));
    EXPECT_FALSE(contains(html, "<body"));
}

TEST(Converter, Strikethrough) {
    auto html = convert_markdown_to_html("this is ~~gone~~ now\n");

    EXPECT_TRUE(contains(html, "<s>gone</s>"));
}

TEST(Converter, TaskList) {
    auto html = convert_markdown_to_html("- [ ] todo\n- [x] done\n");

    EXPECT_TRUE(contains(html, "type=\"checkbox\""));
    EXPECT_TRUE(contains(html, "checked"));
    EXPECT_TRUE(contains(html, "todo"));
    EXPECT_TRUE(contains(html, "done"));
}

TEST(Converter, GfmTable) {
    auto html = convert_markdown_to_html("| Name | Value |\n|------|:-----:|\n| one  | 1     |\n| two  | 2     |\n");

    EXPECT_TRUE(contains(html, "<table"));
    EXPECT_TRUE(contains(html, "Name"));
    EXPECT_TRUE(contains(html, "two"));
    EXPECT_FALSE(contains(html, "|------|"));
}

TEST(Converter, Footnotes) {
    auto html = convert_markdown_to_html("Claim[^src].\n\n[^src]: The source.\n");

    EXPECT_TRUE(contains(html, "<sup class=\"footnote-reference\"><a href=\"#fn-1\">1</a></sup>"));
    EXPECT_TRUE(contains(html, "<div class=\"footnote-definition\" id=\"fn-1\">"));
    EXPECT_TRUE(contains(html, "The source."));
    EXPECT_FALSE(contains(html, "[^src]"));
}

TEST(Converter, SmartPunctuation) {
    auto html = convert_markdown_to_html("He said \"hi\" -- it's over... really --- done\n");

    EXPECT_TRUE(contains(html, "“hi”"));
    EXPECT_TRUE(contains(html, "it’s"));
    EXPECT_TRUE(contains(html, "–"));
    EXPECT_TRUE(contains(html, "…"));
    EXPECT_TRUE(contains(html, "—"));
}

TEST(Converter, CodeBlockIsNotRewritten) {
    auto html = convert_markdown_to_html("```\nx = \"a\" -- b | c\n|---|---|\n```\n");

    EXPECT_TRUE(contains(html, "\"a\" -- b"));
    EXPECT_FALSE(contains(html, "<table"));
}

TEST(Converter, WindowsLineEndings) {
    auto html = convert_markdown_to_html("# Hello\r\nWorld\r\n");

    EXPECT_TRUE(contains(html, "<h1>Hello</h1>"));
    EXPECT_FALSE(contains(html, "\r"));
}

TEST(Converter, MalformedInputDoesNotThrow) {
    EXPECT_NO_THROW(convert_markdown_to_html("**unclosed [link](\n```\nunterminated fence\n| a |\n|---|\n[^dangling]\n"));
    EXPECT_NO_THROW(convert_markdown_to_html(""));
}



TEST(GfmTables, RewrittenIntoMaddyTableBlock) {
    auto out = convert_gfm_tables("| a | b |\n|---|:-:|\n| 1 | 2 |\n| 3 |\n\nafter\n");

    EXPECT_EQ(out, "\n|table>\na|b\n- | -\n1|2\n3|\n|<table\n\n\nafter\n");
}

TEST(GfmTables, EscapedPipeStaysInCell) {
    auto out = convert_gfm_tables("a | b\n--- | ---\nx \\| y | z\n");

    EXPECT_TRUE(contains(out, "x &#124; y|z"));
}

TEST(GfmTables, MismatchedDelimiterIsNotATable) {
    auto out = convert_gfm_tables("| a | b |\n|---|\n");

    EXPECT_EQ(out, "| a | b |\n|---|\n");
}

TEST(GfmTables, PlainRuleIsNotATable) {
    auto out = convert_gfm_tables("text\n---\n");

    EXPECT_EQ(out, "text\n---\n");
}



TEST(Footnotes, NumberedByFirstReference) {
    std::vector<Footnote> footnotes;
    auto out = extract_footnotes("B[^b] then A[^a] and B again[^b].\n\n[^a]: First defined.\n[^b]: Second defined.\n", footnotes);

    ASSERT_EQ(footnotes.size(), 2u);
    EXPECT_EQ(footnotes[0].label, "b");
    EXPECT_EQ(footnotes[0].number, 1u);
    EXPECT_EQ(footnotes[1].label, "a");
    EXPECT_EQ(footnotes[1].number, 2u);

    EXPECT_TRUE(contains(out, "B<sup class=\"footnote-reference\"><a href=\"#fn-1\">1</a></sup> then A<sup class=\"footnote-reference\"><a href=\"#fn-2\">2</a></sup>"));
    EXPECT_FALSE(contains(out, "First defined."));
}

TEST(Footnotes, IndentedLinesContinueDefinition) {
    std::vector<Footnote> footnotes;
    extract_footnotes("x[^n]\n\n[^n]: line one\n    line two\nafter\n", footnotes);

    ASSERT_EQ(footnotes.size(), 1u);
    EXPECT_EQ(footnotes[0].text, "line one\nline two");
}

TEST(Footnotes, UndefinedReferenceAndCodeSpanStayLiteral) {
    std::vector<Footnote> footnotes;
    auto out = extract_footnotes("missing[^nope] and `code[^n]` and real[^n]\n\n[^n]: note\n", footnotes);

    EXPECT_TRUE(contains(out, "missing[^nope]"));
    EXPECT_TRUE(contains(out, "`code[^n]`"));
    EXPECT_TRUE(contains(out, "real<sup"));
}

TEST(Footnotes, UnreferencedDefinitionIsStillRendered) {
    std::vector<Footnote> footnotes;
    extract_footnotes("no refs\n\n[^lonely]: alone\n", footnotes);

    ASSERT_EQ(footnotes.size(), 1u);
    EXPECT_FALSE(footnotes[0].referenced);
    EXPECT_EQ(footnotes[0].number, 1u);
    EXPECT_TRUE(contains(render_footnote_definitions(footnotes), "alone"));
}
