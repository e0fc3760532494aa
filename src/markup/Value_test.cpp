#include "Value.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "HtmlRenderable.hpp"
#include "Markup.hpp"
#include "errors.hpp"

using namespace markup;

namespace {

class Link : public HtmlRenderable {
 public:
  virtual std::string html() const { return "<a href=\"/\">home</a>"; }
};

}  // namespace

// ==================== CONSTRUCTION ====================

TEST(ValueKindTests, ScalarConstructors) {
  EXPECT_EQ(Value().kind(), Value::NONE);
  EXPECT_EQ(Value(true).kind(), Value::BOOL);
  EXPECT_EQ(Value(3).kind(), Value::INT);
  EXPECT_EQ(Value(3L).kind(), Value::INT);
  EXPECT_EQ(Value(3ULL).kind(), Value::INT);
  EXPECT_EQ(Value(2.5).kind(), Value::FLOAT);
  EXPECT_EQ(Value("x").kind(), Value::STRING);
  EXPECT_EQ(Value(std::string("x")).kind(), Value::STRING);
}

TEST(ValueKindTests, NullPointerIsNone) {
  EXPECT_TRUE(Value(static_cast<const char*>(NULL)).isNone());
}

TEST(ValueKindTests, SafeSources) {
  Value m(Markup("<b>"));
  EXPECT_TRUE(m.isSafe());
  EXPECT_EQ(m.text(), "<b>");

  Link link;
  Value hooked(link);
  EXPECT_TRUE(hooked.isSafe());
  EXPECT_EQ(hooked.text(), "<a href=\"/\">home</a>");
}

TEST(ValueKindTests, UnsignedOverflowThrows) {
  EXPECT_THROW(Value(18446744073709551615ULL), ValueError);
}

// ==================== CONTAINERS ====================

TEST(ValueListTests, AppendAndIndex) {
  Value list = Value::list();
  list.append(1).append("two");
  ASSERT_EQ(list.size(), 2U);
  EXPECT_EQ(list.at(0).asInt(), 1);
  EXPECT_EQ(list.at(1).text(), "two");
  EXPECT_THROW(list.at(2), LookupError);
}

TEST(ValueListTests, AppendToScalarThrows) {
  Value v(1);
  EXPECT_THROW(v.append(2), TypeError);
  EXPECT_THROW(v.at(0), TypeError);
}

TEST(ValueMapTests, SetGetHas) {
  Value map = Value::map();
  map.set("b", 2).set("a", "x");
  EXPECT_TRUE(map.has("a"));
  EXPECT_FALSE(map.has("c"));
  EXPECT_EQ(map.get("b").asInt(), 2);
  EXPECT_THROW(map.get("c"), LookupError);

  std::vector<std::string> keys = map.keys();
  ASSERT_EQ(keys.size(), 2U);
  EXPECT_EQ(keys[0], "a");
  EXPECT_EQ(keys[1], "b");
}

TEST(ValueMapTests, SetOnListThrows) {
  Value list = Value::list();
  EXPECT_THROW(list.set("k", 1), TypeError);
  EXPECT_THROW(list.get("k"), TypeError);
  EXPECT_FALSE(list.has("k"));
}

TEST(ValueCopyTests, CopiesAreIndependent) {
  Value a = Value::list();
  a.append(1);
  Value b = a;
  b.append(2);
  EXPECT_EQ(a.size(), 1U);
  EXPECT_EQ(b.size(), 2U);
}

TEST(ValueCopyTests, AssignFromOwnMember) {
  Value outer = Value::list();
  outer.append(Value::list().append("inner"));
  outer = outer.at(0);
  ASSERT_EQ(outer.kind(), Value::LIST);
  EXPECT_EQ(outer.at(0).text(), "inner");
}

// ==================== CONVERSIONS ====================

TEST(ValueStrTests, Scalars) {
  EXPECT_EQ(Value().str(), "None");
  EXPECT_EQ(Value(true).str(), "True");
  EXPECT_EQ(Value(false).str(), "False");
  EXPECT_EQ(Value(-12).str(), "-12");
  EXPECT_EQ(Value(3.14).str(), "3.14");
  EXPECT_EQ(Value(1.0).str(), "1.0");
  EXPECT_EQ(Value("a'b").str(), "a'b");
}

TEST(ValueStrTests, Containers) {
  Value list = Value::list();
  list.append(1).append("a").append(Markup("<b>"));
  EXPECT_EQ(list.str(), "[1, 'a', Markup('<b>')]");

  Value map = Value::map();
  map.set("y", 2).set("x", "v");
  EXPECT_EQ(map.str(), "{'x': 'v', 'y': 2}");
}

TEST(ValueReprTests, QuotesText) {
  EXPECT_EQ(Value("abc").repr(), "'abc'");
  EXPECT_EQ(Value("it's").repr(), "\"it's\"");
  EXPECT_EQ(Value("a\nb").repr(), "'a\\nb'");
  EXPECT_EQ(Value(Markup("x")).repr(), "Markup('x')");
  EXPECT_EQ(Value(5).repr(), "5");
}

TEST(ValueNumberTests, AsIntAndAsFloat) {
  EXPECT_EQ(Value(true).asInt(), 1);
  EXPECT_EQ(Value(3.9).asInt(), 3);
  EXPECT_EQ(Value(-3.9).asInt(), -3);
  EXPECT_DOUBLE_EQ(Value(4).asFloat(), 4.0);
  EXPECT_THROW(Value("4").asInt(), TypeError);
  EXPECT_THROW(Value("4").asFloat(), TypeError);
  EXPECT_THROW(Value(1e300).asInt(), ValueError);
}

TEST(ValueNumberTests, AsBool) {
  EXPECT_FALSE(Value().asBool());
  EXPECT_FALSE(Value(0).asBool());
  EXPECT_TRUE(Value(0.5).asBool());
  EXPECT_FALSE(Value("").asBool());
  EXPECT_TRUE(Value("x").asBool());
  EXPECT_FALSE(Value::list().asBool());
}

TEST(ValueTextTests, TextOfNumberThrows) {
  EXPECT_THROW(Value(1).text(), TypeError);
}
