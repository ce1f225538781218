#include <gtest/gtest.h>
#include <fragmenter/split/content_splitter.h>
#include <fragmenter/split/html_splitter.h>

#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

using namespace fragmenter::split;

static_assert(!std::is_copy_constructible_v<HtmlSplitter>);
static_assert(!std::is_move_constructible_v<HtmlSplitter>);

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

class HtmlSplitterTest : public ::testing::Test {
protected:
    std::vector<std::string> split(const std::string& html, int64_t maxLength) {
        return splitHtmlContent(html, maxLength).toVector();
    }

    std::string sample_html_ = R"(
    <div class="content">
        <h1>Title</h1>
        <p>First paragraph with some text.</p>
        <p>Second paragraph with <b>bold text</b> and more content.</p>
    </div>
    )";
};

TEST_F(HtmlSplitterTest, BasicSplitPreservesRoot) {
    auto fragments = split(sample_html_, 50);
    ASSERT_GT(fragments.size(), 1u);
    for (const auto& fragment : fragments) {
        EXPECT_TRUE(contains(fragment, "<div")) << fragment;
        EXPECT_TRUE(contains(fragment, "</div>")) << fragment;
    }
}

TEST_F(HtmlSplitterTest, EmptyInput) {
    EXPECT_TRUE(split("", 100).empty());
}

TEST_F(HtmlSplitterTest, NonPositiveMaxLength) {
    EXPECT_TRUE(split("<p>text</p>", 0).empty());
    EXPECT_TRUE(split("<p>text</p>", -5).empty());
}

TEST_F(HtmlSplitterTest, NestedTags) {
    auto fragments = split("<div><p><b>Bold</b> text</p></div>", 20);
    ASSERT_GT(fragments.size(), 1u);
    for (const auto& fragment : fragments) {
        EXPECT_TRUE(contains(fragment, "<div")) << fragment;
        EXPECT_TRUE(contains(fragment, "</div>")) << fragment;
    }
}

TEST_F(HtmlSplitterTest, ReopensAncestorTagsVerbatim) {
    auto fragments = split(R"(<div class="c"><p>aaaa</p><p>bbbb</p></div>)", 40);
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0], R"(<div class="c"><p>aaaa</p><p></p></div>)");
    EXPECT_EQ(fragments[1], R"(<div class="c"><p>bbbb</p></div>)");
}

TEST_F(HtmlSplitterTest, SingleFragmentWhenItFits) {
    auto fragments = split("<p>Hello <em>world</em></p>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<p>Hello <em>world</em></p>");
}

TEST_F(HtmlSplitterTest, FragmentsRespectBudget) {
    std::string html = "<div>";
    for (int i = 0; i < 40; ++i) {
        html += "item" + std::to_string(i) + "<br/>";
    }
    html += "</div>";

    auto fragments = split(html, 30);
    ASSERT_GT(fragments.size(), 1u);
    for (const auto& fragment : fragments) {
        EXPECT_LE(fragment.size(), 30u) << fragment;
        EXPECT_TRUE(startsWith(fragment, "<div>")) << fragment;
        EXPECT_TRUE(endsWith(fragment, "</div>")) << fragment;
    }
}

TEST_F(HtmlSplitterTest, TextIsNotLostAcrossFragments) {
    std::string html = "<ul>";
    for (int i = 0; i < 20; ++i) {
        html += "<li>entry " + std::to_string(i) + "</li>";
    }
    html += "</ul>";

    auto fragments = split(html, 48);
    std::string all;
    for (const auto& fragment : fragments) {
        all += fragment;
    }
    size_t last = 0;
    for (int i = 0; i < 20; ++i) {
        auto at = all.find("entry " + std::to_string(i) + "<", last);
        ASSERT_NE(at, std::string::npos) << "entry " << i;
        last = at;
    }
}

TEST_F(HtmlSplitterTest, OversizedUnitIsEmittedWhole) {
    const std::string run(50, 'x');
    auto fragments = split("<p>" + run + "</p>", 20);

    ASSERT_EQ(fragments.size(), 3u);
    EXPECT_EQ(fragments[0], "<p></p>");
    EXPECT_EQ(fragments[1], "<p>" + run + "</p>");
    EXPECT_EQ(fragments[2], "<p></p>");

    for (const auto& fragment : fragments) {
        if (fragment.size() > 20) {
            EXPECT_TRUE(contains(fragment, run));
        }
    }
}

TEST_F(HtmlSplitterTest, TruncatedTrailingTagIsDiscarded) {
    auto fragments = split("<div>test<", 20);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<div>test</div>");
}

TEST_F(HtmlSplitterTest, MalformedTagsAreTolerated) {
    auto fragments = split("<div><p>Unclosed paragraph<div>More text</div>", 50);
    EXPECT_FALSE(fragments.empty());
}

TEST_F(HtmlSplitterTest, MismatchedClosingTagIsKeptButIgnored) {
    auto fragments = split("<div>a</span>b</div>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<div>a</span>b</div>");
}

TEST_F(HtmlSplitterTest, SelfClosingTagsDoNotAffectHierarchy) {
    const std::string html = R"(
    <div>
        <p>Test with self-closing tags</p>
        <br/>
        <img src="test.jpg" />
        <input type="text"/>
    </div>
    )";

    auto fragments = split(html, 50);
    ASSERT_EQ(fragments.size(), 3u);
    for (const auto& fragment : fragments) {
        EXPECT_TRUE(contains(fragment, "<div")) << fragment;
        EXPECT_TRUE(contains(fragment, "</div>")) << fragment;
    }
    EXPECT_EQ(fragments[1], R"(<div><img src="test.jpg" /></div>)");
    EXPECT_EQ(fragments[2], R"(<div><input type="text"/></div>)");
}

TEST_F(HtmlSplitterTest, WhitespaceOnlyTextIsDropped) {
    auto fragments = split("<ul>\n  <li>a</li>\n  <li>b</li>\n</ul>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<ul><li>a</li><li>b</li></ul>");
}

TEST_F(HtmlSplitterTest, VoidElementsStayOpenByDefault) {
    auto fragments = split("<div>a<br>b</div>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<div>a<br>b</div></br></div>");
}

TEST_F(HtmlSplitterTest, VoidElementsOption) {
    SplitConfig config;
    config.maxLength = 100;
    config.voidElementsSelfClose = true;

    auto fragments = splitHtmlContent("<div>a<br>b<IMG src=x></div>", config).toVector();
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<div>a<br>b<IMG src=x></div>");
}

TEST_F(HtmlSplitterTest, MarkupDeclarationsOption) {
    const std::string html = "<!DOCTYPE html><!-- note --><p>x</p>";

    SplitConfig config;
    config.maxLength = 100;
    config.skipMarkupDeclarations = true;
    auto fragments = splitHtmlContent(html, config).toVector();
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], html);
}

TEST_F(HtmlSplitterTest, NonAsciiWhitespaceTextIsKept) {
    // Only ASCII whitespace marks a text run as blank
    auto fragments = split("<p>\xC2\xA0</p>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<p>\xC2\xA0</p>");
}

TEST_F(HtmlSplitterTest, NamelessTagIsKeptVerbatim) {
    auto fragments = split("<p><>x</p>", 100);
    ASSERT_EQ(fragments.size(), 1u);
    EXPECT_EQ(fragments[0], "<p><>x</p>");
}

TEST_F(HtmlSplitterTest, ProducesFragmentsLazily) {
    std::string html = "<div>";
    for (int i = 0; i < 1000; ++i) {
        html += "<p>paragraph number " + std::to_string(i) + "</p>";
    }
    html += "</div>";

    SplitConfig config;
    config.maxLength = 64;
    HtmlSplitter splitter(html, config);

    auto first = splitter.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_LT(splitter.scannedBytes(), html.size() / 10);
    EXPECT_TRUE(startsWith(*first, "<div>"));
}

TEST(HtmlParseTagTest, ClassifiesTags) {
    SplitConfig config;

    auto closing = parseTag("</div >", config);
    EXPECT_EQ(closing.kind, TagKind::Closing);
    EXPECT_EQ(closing.name, "div");

    auto selfClosing = parseTag("<img src='a.png'/>", config);
    EXPECT_EQ(selfClosing.kind, TagKind::SelfClosing);

    auto opening = parseTag("<a href=\"x\">", config);
    EXPECT_EQ(opening.kind, TagKind::Opening);
    EXPECT_EQ(opening.name, "a");
    EXPECT_EQ(opening.raw, "<a href=\"x\">");

    auto spaced = parseTag("</ div>", config);
    EXPECT_EQ(spaced.kind, TagKind::Closing);
    EXPECT_EQ(spaced.name, "");

    auto doctype = parseTag("<!DOCTYPE html>", config);
    EXPECT_EQ(doctype.kind, TagKind::Opening);
    EXPECT_EQ(doctype.name, "!DOCTYPE");

    config.skipMarkupDeclarations = true;
    EXPECT_EQ(parseTag("<!DOCTYPE html>", config).kind, TagKind::Declaration);
    EXPECT_EQ(parseTag("<?xml version=\"1.0\"?>", config).kind, TagKind::Declaration);
}

TEST(HtmlParseTagTest, VoidElements) {
    EXPECT_TRUE(isVoidElement("br"));
    EXPECT_TRUE(isVoidElement("IMG"));
    EXPECT_FALSE(isVoidElement("div"));
    EXPECT_FALSE(isVoidElement(""));
}
