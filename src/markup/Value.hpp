#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace markup {

class HtmlRenderable;
class Markup;

/**
 * A dynamically typed value accepted by escape() and the Markup operations.
 *
 * Scalars (none, bool, integer, float), untagged text, safe text and the
 * two containers (list, map) are supported. Lists stand in for tuples and
 * positional sequences; maps stand in for dictionaries and for objects
 * whose attributes are looked up with "{obj.attr}".
 *
 * Values constructed from an HtmlRenderable call its html() hook once and
 * keep the result as safe text.
 */
class Value {
 public:
  enum Kind { NONE, BOOL, INT, FLOAT, STRING, MARKUP, LIST, MAP };

  Value();
  Value(bool b);
  Value(int n);
  Value(unsigned int n);
  Value(long n);
  Value(unsigned long n);
  Value(long long n);
  Value(unsigned long long n);
  Value(double d);
  Value(const char* text);  // NULL yields a NONE value
  Value(const std::string& text);
  Value(const Markup& markup);
  Value(const HtmlRenderable& obj);
  Value(const Value& other);
  Value& operator=(const Value& other);
  ~Value();

  static Value none();
  static Value list();
  static Value map();

  /**
   * Append an item to a LIST value.
   * @throws TypeError if this value is not a LIST
   */
  Value& append(const Value& item);

  /**
   * Insert or replace a member of a MAP value.
   * @throws TypeError if this value is not a MAP
   */
  Value& set(const std::string& key, const Value& item);

  Kind kind() const;
  bool isNone() const;
  // True for values that carry the safety tag (Markup or hook output).
  bool isSafe() const;
  bool isNumber() const;

  // Number of items for LIST and MAP values, 0 otherwise.
  std::size_t size() const;

  /**
   * Index into a LIST value.
   * @throws TypeError if this value is not a LIST
   * @throws LookupError if the index is out of range
   */
  const Value& at(std::size_t index) const;

  /**
   * Look up a member of a MAP value.
   * @throws TypeError if this value is not a MAP
   * @throws LookupError if the key is absent
   */
  const Value& get(const std::string& key) const;
  bool has(const std::string& key) const;
  std::vector<std::string> keys() const;

  bool asBool() const;
  // Integer view of BOOL, INT and FLOAT (truncated) values.
  long long asInt() const;
  // Floating view of BOOL, INT and FLOAT values.
  double asFloat() const;
  // Raw text of STRING and MARKUP values.
  const std::string& text() const;

  // Standard text conversion ("None", "True", "42", "3.14", ...).
  std::string str() const;
  // Quoted representation ('text', Markup('text'), [1, 'a'], ...).
  std::string repr() const;

  static const char* kindName(Kind kind);

 private:
  Kind kind_;
  long long int_;
  double float_;
  std::string text_;
  std::vector<Value>* items_;
  std::map<std::string, Value>* fields_;

  void copyFrom(const Value& other);
  void release();
};

// Quote text the way Value::repr() renders strings.
std::string quoteText(const std::string& text);

}  // namespace markup
