#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "FormatArgs.hpp"
#include "HtmlRenderable.hpp"
#include "Value.hpp"

namespace markup {

/**
 * Text that is known to be safe for markup output.
 *
 * Constructing a Markup from a string takes the string verbatim: it is the
 * trusted-literal path. Untrusted text becomes Markup through escape() or
 * by being combined with an existing Markup, which escapes it first:
 *
 *   Markup("<em>%s</em>") % "<bad user>"   // <em>&lt;bad user&gt;</em>
 *   Markup("<b>") + "&"                     // <b>&amp;
 *
 * Every operation returns a new value; a Markup is never modified after
 * construction (apart from assignment).
 */
class Markup : public HtmlRenderable {
 public:
  Markup();
  explicit Markup(const char* text);
  explicit Markup(const std::string& text);
  explicit Markup(const HtmlRenderable& obj);
  // Hook output and safe values verbatim, Value::str() for anything else.
  explicit Markup(const Value& value);
  Markup(const Markup& other);
  Markup& operator=(const Markup& other);
  virtual ~Markup();

  // Same as markup::escape().
  static Markup escape(const Value& value);

  // A Markup renders as itself.
  virtual std::string html() const;

  const std::string& str() const;
  std::string repr() const;
  bool empty() const;
  // Length in bytes.
  std::size_t size() const;
  // Length in code points.
  std::size_t length() const;

  // ---------------------------------------------------------------- combine

  /**
   * Append `other`, escaping it unless it is already safe.
   */
  Markup concat(const Value& other) const;

  /**
   * Prepend `other`, escaping it unless it is already safe.
   */
  Markup rconcat(const Value& other) const;

  /**
   * Concatenate `count` copies of this text.
   * @throws ValueError if count is negative or the result is too long
   */
  Markup repeat(long long count) const;

  /**
   * Join the parts with this text as separator; each part is escaped
   * unless it is already safe.
   */
  Markup join(const std::vector<Value>& parts) const;
  // Same, for a LIST value.
  Markup join(const Value& parts) const;

  // ---------------------------------------------------------------- format

  /**
   * printf-style interpolation; see percentFormat().
   */
  Markup interpolate(const Value& args) const;

  /**
   * Brace-style formatting; see braceFormat().
   */
  Markup format(const FormatArgs& args) const;
  Markup format() const;
  Markup format(const Value& a0) const;
  Markup format(const Value& a0, const Value& a1) const;
  Markup format(const Value& a0, const Value& a1, const Value& a2) const;

  // Brace-style formatting with named arguments taken from a MAP value.
  Markup formatMap(const Value& mapping) const;

  // ---------------------------------------------------------------- plain text

  // Resolve entities back to characters. The result is no longer safe.
  std::string unescape() const;

  // Remove tags, collapse whitespace and unescape. The result is plain text.
  std::string stripTags() const;

  // ---------------------------------------------------------------- split

  // A string separator matches the stored text as is.
  std::vector<Markup> split(const Value& sep = Value(),
                            long maxsplit = -1) const;
  std::vector<Markup> rsplit(const Value& sep = Value(),
                             long maxsplit = -1) const;
  std::vector<Markup> splitLines(bool keepends = false) const;
  // Always three parts: head, separator, tail. The separator is escaped.
  std::vector<Markup> partition(const Value& sep) const;
  std::vector<Markup> rpartition(const Value& sep) const;

  // ---------------------------------------------------------------- rearrange

  Markup upper() const;
  Markup lower() const;
  Markup capitalize() const;
  Markup title() const;
  Markup swapCase() const;

  Markup strip(const Value& chars = Value()) const;
  Markup lstrip(const Value& chars = Value()) const;
  Markup rstrip(const Value& chars = Value()) const;

  Markup replace(const Value& old, const Value& replacement,
                 long count = -1) const;

  Markup center(std::size_t width, const Value& fill = Value(" ")) const;
  Markup ljust(std::size_t width, const Value& fill = Value(" ")) const;
  Markup rjust(std::size_t width, const Value& fill = Value(" ")) const;
  Markup zfill(std::size_t width) const;
  Markup expandTabs(int tabsize = 8) const;

  /**
   * Code point at `index`; negative indices count from the end.
   * @throws LookupError if the index is out of range
   */
  Markup at(long index) const;

  // Code points [start, stop); negative bounds count from the end.
  Markup slice(long start, long stop) const;

  // ---------------------------------------------------------------- query

  long find(const Value& sub) const;
  std::size_t count(const Value& sub) const;
  bool startsWith(const Value& prefix) const;
  bool endsWith(const Value& suffix) const;

 private:
  std::string text_;

  static std::string escaped(const Value& value);
  std::string fillChar(const Value& fill) const;
};

Markup operator+(const Markup& lhs, const Markup& rhs);
Markup operator+(const Markup& lhs, const Value& rhs);
Markup operator+(const Value& lhs, const Markup& rhs);
Markup operator*(const Markup& lhs, long long count);
Markup operator*(long long count, const Markup& rhs);
Markup operator%(const Markup& lhs, const Value& args);

bool operator==(const Markup& lhs, const Markup& rhs);
bool operator!=(const Markup& lhs, const Markup& rhs);
bool operator<(const Markup& lhs, const Markup& rhs);
bool operator==(const Markup& lhs, const std::string& rhs);
bool operator!=(const Markup& lhs, const std::string& rhs);
bool operator==(const std::string& lhs, const Markup& rhs);
bool operator!=(const std::string& lhs, const Markup& rhs);
bool operator==(const Markup& lhs, const char* rhs);
bool operator!=(const Markup& lhs, const char* rhs);
bool operator==(const char* lhs, const Markup& rhs);
bool operator!=(const char* lhs, const Markup& rhs);

std::ostream& operator<<(std::ostream& os, const Markup& markup);

}  // namespace markup
