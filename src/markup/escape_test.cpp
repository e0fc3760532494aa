#include "escape.hpp"

#include <gtest/gtest.h>

#include <string>

#include "HtmlRenderable.hpp"
#include "Markup.hpp"

using namespace markup;

namespace {

class Emphasis : public HtmlRenderable {
 public:
  virtual std::string html() const { return "<em>X</em>"; }
};

}  // namespace

// ==================== escapeText ====================

TEST(EscapeTextTests, AllSpecialCharacters) {
  EXPECT_EQ(escapeText("\"<>&'"), "&#34;&lt;&gt;&amp;&#39;");
}

TEST(EscapeTextTests, EmptyString) {
  EXPECT_EQ(escapeText(""), "");
}

TEST(EscapeTextTests, PlainTextUnchanged) {
  EXPECT_EQ(escapeText("hello world"), "hello world");
}

TEST(EscapeTextTests, SpecialCharactersBetweenText) {
  EXPECT_EQ(escapeText("abcd&><'\"efgh"), "abcd&amp;&gt;&lt;&#39;&#34;efgh");
  EXPECT_EQ(escapeText("&><'\"efgh"), "&amp;&gt;&lt;&#39;&#34;efgh");
  EXPECT_EQ(escapeText("abcd&><'\""), "abcd&amp;&gt;&lt;&#39;&#34;");
}

TEST(EscapeTextTests, MultiByteCharactersKept) {
  EXPECT_EQ(escapeText("\xC3\x84\xC3\x96&<\xC3\x9C"),
            "\xC3\x84\xC3\x96&amp;&lt;\xC3\x9C");
  EXPECT_EQ(escapeText("\xE3\x81\x93\xE3\x82\x93&><'\""),
            "\xE3\x81\x93\xE3\x82\x93&amp;&gt;&lt;&#39;&#34;");
}

TEST(EscapeTextTests, AstralCharactersKept) {
  // U+1F363 U+1F362
  const std::string sushi = "\xF0\x9F\x8D\xA3\xF0\x9F\x8D\xA2";
  EXPECT_EQ(escapeText(sushi + "&><'\"" + sushi),
            sushi + "&amp;&gt;&lt;&#39;&#34;" + sushi);
}

TEST(EscapeTextTests, EntitiesAreEscapedAgain) {
  EXPECT_EQ(escapeText("&amp;"), "&amp;amp;");
}

// ==================== unescapeText ====================

TEST(UnescapeTextTests, FiveEntities) {
  EXPECT_EQ(unescapeText("&#34;&lt;&gt;&amp;&#39;"), "\"<>&'");
}

TEST(UnescapeTextTests, Aliases) {
  EXPECT_EQ(unescapeText("&quot;&apos;&#x27;&#x22;"), "\"''\"");
}

TEST(UnescapeTextTests, SinglePassDecoding) {
  EXPECT_EQ(unescapeText("&amp;lt;"), "&lt;");
}

TEST(UnescapeTextTests, UnknownEntitiesKept) {
  EXPECT_EQ(unescapeText("&nbsp; & &copy;"), "&nbsp; & &copy;");
  EXPECT_EQ(unescapeText("trailing &"), "trailing &");
}

TEST(UnescapeTextTests, RoundTripsEscapedText) {
  const std::string samples[] = {
      "",
      "plain",
      "\"<>&'",
      "a && b < c > d",
      "\xC3\x84\xC3\x96&<\xC3\x9C",
      "\xF0\x9F\x8D\xA3&\xF0\x9F\x8D\xA2'",
  };
  for (size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); ++i) {
    EXPECT_EQ(unescapeText(escapeText(samples[i])), samples[i]);
  }
}

// ==================== escape ====================

TEST(EscapeTests, ReturnsMarkup) {
  Markup m = escape("<b>");
  EXPECT_EQ(m, "&lt;b&gt;");
}

TEST(EscapeTests, IsIdempotent) {
  Markup once = escape("a & <b>");
  Markup twice = escape(once);
  EXPECT_EQ(once, twice);
  EXPECT_EQ(twice, "a &amp; &lt;b&gt;");
}

TEST(EscapeTests, MarkupPassesThrough) {
  EXPECT_EQ(escape(Markup("<em>ok</em>")), "<em>ok</em>");
}

TEST(EscapeTests, HookOutputIsTrusted) {
  Emphasis obj;
  EXPECT_EQ(escape(obj), "<em>X</em>");
}

TEST(EscapeTests, NonTextValuesUseTheirTextForm) {
  EXPECT_EQ(escape(42), "42");
  EXPECT_EQ(escape(1.5), "1.5");
  EXPECT_EQ(escape(true), "True");
  EXPECT_EQ(escape(Value::none()), "None");
  EXPECT_EQ(escape(Value::list().append("<a>")), "[&#39;&lt;a&gt;&#39;]");
}

TEST(EscapeTests, EmptyString) {
  EXPECT_TRUE(escape("").empty());
}

TEST(EscapeSilentTests, NoneBecomesEmpty) {
  EXPECT_EQ(escapeSilent(Value::none()), "");
  EXPECT_EQ(escapeSilent(static_cast<const char*>(NULL)), "");
}

TEST(EscapeSilentTests, OtherValuesAreEscaped) {
  EXPECT_EQ(escapeSilent("<foo>"), "&lt;foo&gt;");
  EXPECT_EQ(escapeSilent(0), "0");
  EXPECT_EQ(escapeSilent(Markup("<b>")), "<b>");
}

// ==================== softStr ====================

TEST(SoftStrTests, KeepsSafeValuesSafe) {
  Value v = softStr(Markup("<b>"));
  EXPECT_TRUE(v.isSafe());
  EXPECT_EQ(v.text(), "<b>");
}

TEST(SoftStrTests, ConvertsWithoutEscaping) {
  Value s = softStr("<b>");
  EXPECT_EQ(s.kind(), Value::STRING);
  EXPECT_EQ(s.text(), "<b>");

  Value n = softStr(7);
  EXPECT_EQ(n.kind(), Value::STRING);
  EXPECT_EQ(n.text(), "7");
}
