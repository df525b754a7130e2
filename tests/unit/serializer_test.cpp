#include <sleek/html/serializer.h>
#include <sleek/html/tree_builder.h>
#include <gtest/gtest.h>
#include <string>

using namespace sleek::html;

// ------------------------------------------------------------------
// Escaping
// ------------------------------------------------------------------

TEST(HtmlSerializer, TextIsEscaped) {
    auto doc = parse("<p>a &lt; b &amp;&amp; c &gt; d \"q\"</p>");
    auto* p = doc->find_element("p");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(serialize(*p), "<p>a &lt; b &amp;&amp; c &gt; d \"q\"</p>");
}

TEST(HtmlSerializer, NoBreakSpaceEscaped) {
    auto doc = parse("<p>a&nbsp;b</p>");
    auto* p = doc->find_element("p");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(serialize(*p), "<p>a&nbsp;b</p>");
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

TEST(HtmlSerializer, WellFormedDocumentIsStable) {
    const std::string input =
        "<!DOCTYPE html><html><head><title>T</title></head>"
        "<body><p class=\"x\">Hello</p></body></html>";
    auto doc = parse(input);
    EXPECT_EQ(serialize(*doc), input);
}

TEST(HtmlSerializer, ImpliedElementsAreWritten) {
    auto doc = parse("<p>a</p>");
    EXPECT_EQ(serialize(*doc), "<html><head></head><body><p>a</p></body></html>");
}

TEST(HtmlSerializer, VoidElementsHaveNoEndTag) {
    auto doc = parse("<body><img src=\"a.png\"><br></body>");
    const std::string out = serialize(*doc);
    EXPECT_NE(out.find("<img src=\"a.png\"><br>"), std::string::npos);
    EXPECT_EQ(out.find("</img>"), std::string::npos);
    EXPECT_EQ(out.find("</br>"), std::string::npos);
}

TEST(HtmlSerializer, RawTextNotEscaped) {
    auto doc = parse("<script>if (a < b && c) {}</script><style>a > b {}</style>");
    const std::string out = serialize(*doc);
    EXPECT_NE(out.find("<script>if (a < b && c) {}</script>"), std::string::npos);
    EXPECT_NE(out.find("<style>a > b {}</style>"), std::string::npos);
}

TEST(HtmlSerializer, DecodedTextIsReEscaped) {
    auto doc = parse("<p>1 &lt; 2 &amp; 3</p>");
    auto* p = doc->find_element("p");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->text_content(), "1 < 2 & 3");
    EXPECT_EQ(serialize(*p), "<p>1 &lt; 2 &amp; 3</p>");
}

TEST(HtmlSerializer, AttributeValuesAreQuoted) {
    auto doc = parse("<a href=/x?a=1&amp;b=2 title='say \"hi\"'>t</a>");
    auto* a = doc->find_element("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(serialize(*a), "<a href=\"/x?a=1&amp;b=2\" title=\"say &quot;hi&quot;\">t</a>");
}

TEST(HtmlSerializer, CommentsPreserved) {
    auto doc = parse("<body><!-- keep --></body>");
    EXPECT_NE(serialize(*doc).find("<!-- keep -->"), std::string::npos);
}

TEST(HtmlSerializer, ModifiedTreeIsWritten) {
    auto doc = parse("<body><a href=\"/old\">x</a></body>");
    auto* a = doc->find_element("a");
    ASSERT_NE(a, nullptr);
    a->set_attribute("href", "/proxy?url=http%3A%2F%2Fx.com%2Fold");
    a->set_attribute("rel", "noreferrer noopener");
    EXPECT_EQ(serialize(*a),
              "<a href=\"/proxy?url=http%3A%2F%2Fx.com%2Fold\" rel=\"noreferrer noopener\">x</a>");
}

TEST(HtmlSerializer, IframeBeforeBodyIsWrittenInBody) {
    auto doc = parse("<iframe src=\"/f\"></iframe><video></video>");
    EXPECT_EQ(serialize(*doc),
              "<html><head></head><body><iframe src=\"/f\"></iframe><video></video></body></html>");
}
