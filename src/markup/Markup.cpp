#include "Markup.hpp"

#include <algorithm>
#include <ostream>

#include "errors.hpp"
#include "escape.hpp"
#include "format.hpp"
#include "utf8.hpp"

namespace markup {

namespace {

bool isSpace(char c) {
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\v':
    case '\f':
    case '\x1c':
    case '\x1d':
    case '\x1e':
    case '\x1f':
      return true;
    default:
      return false;
  }
}

bool isAsciiLower(char c) {
  return c >= 'a' && c <= 'z';
}

bool isAsciiUpper(char c) {
  return c >= 'A' && c <= 'Z';
}

char toAsciiUpper(char c) {
  return isAsciiLower(c) ? static_cast<char>(c - 'a' + 'A') : c;
}

char toAsciiLower(char c) {
  return isAsciiUpper(c) ? static_cast<char>(c - 'A' + 'a') : c;
}

// Length of the whitespace code point starting at `pos`, or 0 if there is
// none. Covers the ASCII set above plus U+0085, U+00A0, U+1680,
// U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::size_t spaceLength(const std::string& s, std::size_t pos) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  if (c < 0x80) {
    return isSpace(s[pos]) ? 1 : 0;
  }
  std::size_t len = utf8::sequenceLength(s, pos);
  if (len == 2) {
    unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
    return (c == 0xC2 && (c1 == 0x85 || c1 == 0xA0)) ? 2 : 0;
  }
  if (len == 3) {
    unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
    unsigned char c2 = static_cast<unsigned char>(s[pos + 2]);
    if ((c == 0xE1 && c1 == 0x9A && c2 == 0x80) ||
        (c == 0xE2 && c1 == 0x80 &&
         (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF)) ||
        (c == 0xE2 && c1 == 0x81 && c2 == 0x9F) ||
        (c == 0xE3 && c1 == 0x80 && c2 == 0x80)) {
      return 3;
    }
  }
  return 0;
}

// Length of the whitespace code point ending at `end`, or 0.
std::size_t spaceLengthBefore(const std::string& s, std::size_t end) {
  for (std::size_t n = 1; n <= 3 && n <= end; ++n) {
    if (spaceLength(s, end - n) == n) {
      return n;
    }
  }
  return 0;
}

// Text of `value` as a plain string search sees it: no escaping.
std::string plainText(const Value& value) {
  if (value.kind() == Value::STRING || value.isSafe()) {
    return value.text();
  }
  return value.str();
}

// Length of the line break starting at `pos`, or 0 if there is none.
std::size_t lineBreakLength(const std::string& s, std::size_t pos) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  switch (c) {
    case '\r':
      return (pos + 1 < s.size() && s[pos + 1] == '\n') ? 2 : 1;
    case '\n':
    case '\v':
    case '\f':
    case 0x1c:
    case 0x1d:
    case 0x1e:
      return 1;
    case 0xC2:  // U+0085 NEXT LINE
      return (pos + 1 < s.size() &&
              static_cast<unsigned char>(s[pos + 1]) == 0x85)
                 ? 2
                 : 0;
    case 0xE2:  // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
      if (pos + 2 < s.size() &&
          static_cast<unsigned char>(s[pos + 1]) == 0x80 &&
          (static_cast<unsigned char>(s[pos + 2]) == 0xA8 ||
           static_cast<unsigned char>(s[pos + 2]) == 0xA9)) {
        return 3;
      }
      return 0;
    default:
      return 0;
  }
}

// Split `chars` into its code points.
std::vector<std::string> codePoints(const std::string& chars) {
  std::vector<std::size_t> bounds = utf8::boundaries(chars);
  std::vector<std::string> out;
  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    out.push_back(chars.substr(bounds[i], bounds[i + 1] - bounds[i]));
  }
  return out;
}

bool inSet(const std::vector<std::string>& set, const std::string& cp) {
  return std::find(set.begin(), set.end(), cp) != set.end();
}

std::vector<Markup> wrapAll(const std::vector<std::string>& pieces) {
  std::vector<Markup> out;
  out.reserve(pieces.size());
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    out.push_back(Markup(pieces[i]));
  }
  return out;
}

std::string repeatFill(const std::string& fill, std::size_t n) {
  std::string out;
  out.reserve(fill.size() * n);
  for (std::size_t i = 0; i < n; ++i) {
    out += fill;
  }
  return out;
}

// Clamp a Python-style index into [0, length].
std::size_t normalizeIndex(long index, std::size_t length) {
  long n = static_cast<long>(length);
  if (index < 0) {
    index += n;
    if (index < 0) {
      index = 0;
    }
  }
  if (index > n) {
    index = n;
  }
  return static_cast<std::size_t>(index);
}

}  // namespace

Markup::Markup() {}

Markup::Markup(const char* text) : text_(text ? text : "") {}

Markup::Markup(const std::string& text) : text_(text) {}

Markup::Markup(const HtmlRenderable& obj) : text_(obj.html()) {}

Markup::Markup(const Value& value)
    : text_(value.isSafe() ? value.text() : value.str()) {}

Markup::Markup(const Markup& other) : HtmlRenderable(), text_(other.text_) {}

Markup& Markup::operator=(const Markup& other) {
  if (this != &other) {
    text_ = other.text_;
  }
  return *this;
}

Markup::~Markup() {}

Markup Markup::escape(const Value& value) {
  return markup::escape(value);
}

std::string Markup::html() const {
  return text_;
}

const std::string& Markup::str() const {
  return text_;
}

std::string Markup::repr() const {
  return "Markup(" + quoteText(text_) + ")";
}

bool Markup::empty() const {
  return text_.empty();
}

std::size_t Markup::size() const {
  return text_.size();
}

std::size_t Markup::length() const {
  return utf8::length(text_);
}

std::string Markup::escaped(const Value& value) {
  return markup::escape(value).str();
}

Markup Markup::concat(const Value& other) const {
  return Markup(text_ + escaped(other));
}

Markup Markup::rconcat(const Value& other) const {
  return Markup(escaped(other) + text_);
}

Markup Markup::repeat(long long count) const {
  if (count < 0) {
    throw ValueError("repeat count must be non-negative");
  }
  if (count == 0 || text_.empty()) {
    return Markup();
  }
  if (static_cast<unsigned long long>(count) >
      text_.max_size() / text_.size()) {
    throw ValueError("repeated string is too long");
  }
  std::string out;
  out.reserve(text_.size() * static_cast<std::size_t>(count));
  for (long long i = 0; i < count; ++i) {
    out += text_;
  }
  return Markup(out);
}

Markup Markup::join(const std::vector<Value>& parts) const {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += text_;
    }
    out += escaped(parts[i]);
  }
  return Markup(out);
}

Markup Markup::join(const Value& parts) const {
  if (parts.kind() != Value::LIST) {
    throw TypeError(std::string("can only join a list, not ") +
                    Value::kindName(parts.kind()));
  }
  std::vector<Value> items;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    items.push_back(parts.at(i));
  }
  return join(items);
}

Markup Markup::interpolate(const Value& args) const {
  return Markup(percentFormat(text_, args));
}

Markup Markup::format(const FormatArgs& args) const {
  return Markup(braceFormat(text_, args));
}

Markup Markup::format() const {
  return format(FormatArgs());
}

Markup Markup::format(const Value& a0) const {
  return format(FormatArgs().arg(a0));
}

Markup Markup::format(const Value& a0, const Value& a1) const {
  return format(FormatArgs().arg(a0).arg(a1));
}

Markup Markup::format(const Value& a0, const Value& a1,
                      const Value& a2) const {
  return format(FormatArgs().arg(a0).arg(a1).arg(a2));
}

Markup Markup::formatMap(const Value& mapping) const {
  return format(FormatArgs::fromMap(mapping));
}

std::string Markup::unescape() const {
  return unescapeText(text_);
}

std::string Markup::stripTags() const {
  // Drop every "<...>" run; an unterminated '<' stays literal.
  std::string untagged;
  untagged.reserve(text_.size());
  std::size_t pos = 0;
  while (pos < text_.size()) {
    std::size_t lt = text_.find('<', pos);
    std::size_t gt =
        lt == std::string::npos ? std::string::npos : text_.find('>', lt + 1);
    if (gt == std::string::npos) {
      untagged.append(text_, pos, std::string::npos);
      break;
    }
    untagged.append(text_, pos, lt - pos);
    pos = gt + 1;
  }

  std::string collapsed;
  collapsed.reserve(untagged.size());
  bool pendingSpace = false;
  std::size_t i = 0;
  while (i < untagged.size()) {
    std::size_t space = spaceLength(untagged, i);
    if (space > 0) {
      pendingSpace = !collapsed.empty();
      i += space;
      continue;
    }
    if (pendingSpace) {
      collapsed.push_back(' ');
      pendingSpace = false;
    }
    collapsed.push_back(untagged[i]);
    ++i;
  }
  return unescapeText(collapsed);
}

std::vector<Markup> Markup::split(const Value& sep, long maxsplit) const {
  std::vector<std::string> pieces;
  const std::size_t n = text_.size();
  long splits = 0;
  if (sep.isNone()) {
    std::size_t i = 0;
    while (true) {
      std::size_t space = 0;
      while (i < n && (space = spaceLength(text_, i)) > 0) {
        i += space;
      }
      if (i >= n) {
        break;
      }
      if (maxsplit >= 0 && splits >= maxsplit) {
        pieces.push_back(text_.substr(i));
        break;
      }
      std::size_t j = i;
      while (j < n && spaceLength(text_, j) == 0) {
        ++j;
      }
      pieces.push_back(text_.substr(i, j - i));
      ++splits;
      i = j;
    }
    return wrapAll(pieces);
  }

  std::string s = plainText(sep);
  if (s.empty()) {
    throw ValueError("empty separator");
  }
  std::size_t pos = 0;
  while (maxsplit < 0 || splits < maxsplit) {
    std::size_t found = text_.find(s, pos);
    if (found == std::string::npos) {
      break;
    }
    pieces.push_back(text_.substr(pos, found - pos));
    pos = found + s.size();
    ++splits;
  }
  pieces.push_back(text_.substr(pos));
  return wrapAll(pieces);
}

std::vector<Markup> Markup::rsplit(const Value& sep, long maxsplit) const {
  std::vector<std::string> pieces;
  long splits = 0;
  if (sep.isNone()) {
    std::size_t i = text_.size();
    while (true) {
      std::size_t space = 0;
      while (i > 0 && (space = spaceLengthBefore(text_, i)) > 0) {
        i -= space;
      }
      if (i == 0) {
        break;
      }
      if (maxsplit >= 0 && splits >= maxsplit) {
        pieces.push_back(text_.substr(0, i));
        break;
      }
      std::size_t j = i;
      while (j > 0 && spaceLengthBefore(text_, j) == 0) {
        --j;
      }
      pieces.push_back(text_.substr(j, i - j));
      ++splits;
      i = j;
    }
    std::reverse(pieces.begin(), pieces.end());
    return wrapAll(pieces);
  }

  std::string s = plainText(sep);
  if (s.empty()) {
    throw ValueError("empty separator");
  }
  std::size_t pos = text_.size();
  while (maxsplit < 0 || splits < maxsplit) {
    if (pos < s.size()) {
      break;
    }
    std::size_t found = text_.rfind(s, pos - s.size());
    if (found == std::string::npos) {
      break;
    }
    pieces.push_back(text_.substr(found + s.size(), pos - found - s.size()));
    pos = found;
    ++splits;
  }
  pieces.push_back(text_.substr(0, pos));
  std::reverse(pieces.begin(), pieces.end());
  return wrapAll(pieces);
}

std::vector<Markup> Markup::splitLines(bool keepends) const {
  std::vector<std::string> lines;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < text_.size()) {
    std::size_t len = lineBreakLength(text_, i);
    if (len == 0) {
      ++i;
      continue;
    }
    std::size_t end = keepends ? i + len : i;
    lines.push_back(text_.substr(start, end - start));
    i += len;
    start = i;
  }
  if (start < text_.size()) {
    lines.push_back(text_.substr(start));
  }
  return wrapAll(lines);
}

std::vector<Markup> Markup::partition(const Value& sep) const {
  std::string s = escaped(sep);
  if (s.empty()) {
    throw ValueError("empty separator");
  }
  std::vector<Markup> parts;
  std::size_t found = text_.find(s);
  if (found == std::string::npos) {
    parts.push_back(*this);
    parts.push_back(Markup());
    parts.push_back(Markup());
  } else {
    parts.push_back(Markup(text_.substr(0, found)));
    parts.push_back(Markup(s));
    parts.push_back(Markup(text_.substr(found + s.size())));
  }
  return parts;
}

std::vector<Markup> Markup::rpartition(const Value& sep) const {
  std::string s = escaped(sep);
  if (s.empty()) {
    throw ValueError("empty separator");
  }
  std::vector<Markup> parts;
  std::size_t found = text_.rfind(s);
  if (found == std::string::npos) {
    parts.push_back(Markup());
    parts.push_back(Markup());
    parts.push_back(*this);
  } else {
    parts.push_back(Markup(text_.substr(0, found)));
    parts.push_back(Markup(s));
    parts.push_back(Markup(text_.substr(found + s.size())));
  }
  return parts;
}

Markup Markup::upper() const {
  std::string out(text_);
  std::transform(out.begin(), out.end(), out.begin(), toAsciiUpper);
  return Markup(out);
}

Markup Markup::lower() const {
  std::string out(text_);
  std::transform(out.begin(), out.end(), out.begin(), toAsciiLower);
  return Markup(out);
}

Markup Markup::capitalize() const {
  std::string out(text_);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = i == 0 ? toAsciiUpper(out[i]) : toAsciiLower(out[i]);
  }
  return Markup(out);
}

Markup Markup::title() const {
  std::string out(text_);
  bool previousCased = false;
  for (std::size_t i = 0; i < out.size(); ++i) {
    char c = out[i];
    if (isAsciiLower(c) || isAsciiUpper(c)) {
      out[i] = previousCased ? toAsciiLower(c) : toAsciiUpper(c);
      previousCased = true;
    } else {
      // Non-ASCII bytes count as cased.
      previousCased = static_cast<unsigned char>(c) >= 0x80;
    }
  }
  return Markup(out);
}

Markup Markup::swapCase() const {
  std::string out(text_);
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (isAsciiLower(out[i])) {
      out[i] = toAsciiUpper(out[i]);
    } else if (isAsciiUpper(out[i])) {
      out[i] = toAsciiLower(out[i]);
    }
  }
  return Markup(out);
}

Markup Markup::strip(const Value& chars) const {
  return lstrip(chars).rstrip(chars);
}

Markup Markup::lstrip(const Value& chars) const {
  if (chars.isNone()) {
    std::size_t i = 0;
    std::size_t space = 0;
    while (i < text_.size() && (space = spaceLength(text_, i)) > 0) {
      i += space;
    }
    return Markup(text_.substr(i));
  }
  std::vector<std::string> set = codePoints(escaped(chars));
  std::vector<std::size_t> bounds = utf8::boundaries(text_);
  std::size_t k = 0;
  while (k + 1 < bounds.size() &&
         inSet(set, text_.substr(bounds[k], bounds[k + 1] - bounds[k]))) {
    ++k;
  }
  return Markup(text_.substr(bounds[k]));
}

Markup Markup::rstrip(const Value& chars) const {
  if (chars.isNone()) {
    std::size_t i = text_.size();
    std::size_t space = 0;
    while (i > 0 && (space = spaceLengthBefore(text_, i)) > 0) {
      i -= space;
    }
    return Markup(text_.substr(0, i));
  }
  std::vector<std::string> set = codePoints(escaped(chars));
  std::vector<std::size_t> bounds = utf8::boundaries(text_);
  std::size_t k = bounds.size() - 1;
  while (k > 0 &&
         inSet(set, text_.substr(bounds[k - 1], bounds[k] - bounds[k - 1]))) {
    --k;
  }
  return Markup(text_.substr(0, bounds[k]));
}

Markup Markup::replace(const Value& old, const Value& replacement,
                       long count) const {
  std::string from = escaped(old);
  std::string to = escaped(replacement);
  std::string out;
  long done = 0;
  if (from.empty()) {
    std::vector<std::size_t> bounds = utf8::boundaries(text_);
    for (std::size_t k = 0; k < bounds.size(); ++k) {
      if (count < 0 || done < count) {
        out += to;
        ++done;
      }
      if (k + 1 < bounds.size()) {
        out.append(text_, bounds[k], bounds[k + 1] - bounds[k]);
      }
    }
    return Markup(out);
  }
  std::size_t pos = 0;
  while (count < 0 || done < count) {
    std::size_t found = text_.find(from, pos);
    if (found == std::string::npos) {
      break;
    }
    out.append(text_, pos, found - pos);
    out += to;
    pos = found + from.size();
    ++done;
  }
  out.append(text_, pos, std::string::npos);
  return Markup(out);
}

std::string Markup::fillChar(const Value& fill) const {
  std::string f = escaped(fill);
  if (utf8::length(f) != 1) {
    throw TypeError("The fill character must be exactly one character long");
  }
  return f;
}

Markup Markup::center(std::size_t width, const Value& fill) const {
  std::string f = fillChar(fill);
  std::size_t len = length();
  if (width <= len) {
    return *this;
  }
  std::size_t margin = width - len;
  std::size_t left = margin / 2 + (margin & width & 1);
  return Markup(repeatFill(f, left) + text_ + repeatFill(f, margin - left));
}

Markup Markup::ljust(std::size_t width, const Value& fill) const {
  std::string f = fillChar(fill);
  std::size_t len = length();
  if (width <= len) {
    return *this;
  }
  return Markup(text_ + repeatFill(f, width - len));
}

Markup Markup::rjust(std::size_t width, const Value& fill) const {
  std::string f = fillChar(fill);
  std::size_t len = length();
  if (width <= len) {
    return *this;
  }
  return Markup(repeatFill(f, width - len) + text_);
}

Markup Markup::zfill(std::size_t width) const {
  std::size_t len = length();
  if (width <= len) {
    return *this;
  }
  std::string zeros(width - len, '0');
  if (!text_.empty() && (text_[0] == '+' || text_[0] == '-')) {
    return Markup(text_.substr(0, 1) + zeros + text_.substr(1));
  }
  return Markup(zeros + text_);
}

Markup Markup::expandTabs(int tabsize) const {
  std::string out;
  out.reserve(text_.size());
  std::size_t column = 0;
  std::size_t pos = 0;
  while (pos < text_.size()) {
    std::size_t len = utf8::sequenceLength(text_, pos);
    char c = text_[pos];
    if (c == '\t') {
      if (tabsize > 0) {
        std::size_t spaces =
            static_cast<std::size_t>(tabsize) - column % tabsize;
        out.append(spaces, ' ');
        column += spaces;
      }
    } else {
      out.append(text_, pos, len);
      column = (c == '\n' || c == '\r') ? 0 : column + 1;
    }
    pos += len;
  }
  return Markup(out);
}

Markup Markup::at(long index) const {
  std::vector<std::size_t> bounds = utf8::boundaries(text_);
  long n = static_cast<long>(bounds.size()) - 1;
  if (index < 0) {
    index += n;
  }
  if (index < 0 || index >= n) {
    throw LookupError("string index out of range");
  }
  std::size_t k = static_cast<std::size_t>(index);
  return Markup(text_.substr(bounds[k], bounds[k + 1] - bounds[k]));
}

Markup Markup::slice(long start, long stop) const {
  std::vector<std::size_t> bounds = utf8::boundaries(text_);
  std::size_t n = bounds.size() - 1;
  std::size_t first = normalizeIndex(start, n);
  std::size_t last = normalizeIndex(stop, n);
  if (last <= first) {
    return Markup();
  }
  return Markup(text_.substr(bounds[first], bounds[last] - bounds[first]));
}

long Markup::find(const Value& sub) const {
  std::size_t found = text_.find(plainText(sub));
  if (found == std::string::npos) {
    return -1;
  }
  return static_cast<long>(utf8::length(text_.substr(0, found)));
}

std::size_t Markup::count(const Value& sub) const {
  std::string s = plainText(sub);
  if (s.empty()) {
    return length() + 1;
  }
  std::size_t n = 0;
  std::size_t pos = text_.find(s);
  while (pos != std::string::npos) {
    ++n;
    pos = text_.find(s, pos + s.size());
  }
  return n;
}

bool Markup::startsWith(const Value& prefix) const {
  std::string p = plainText(prefix);
  return text_.size() >= p.size() && text_.compare(0, p.size(), p) == 0;
}

bool Markup::endsWith(const Value& suffix) const {
  std::string s = plainText(suffix);
  return text_.size() >= s.size() &&
         text_.compare(text_.size() - s.size(), s.size(), s) == 0;
}

Markup operator+(const Markup& lhs, const Markup& rhs) {
  return Markup(lhs.str() + rhs.str());
}

Markup operator+(const Markup& lhs, const Value& rhs) {
  return lhs.concat(rhs);
}

Markup operator+(const Value& lhs, const Markup& rhs) {
  return rhs.rconcat(lhs);
}

Markup operator*(const Markup& lhs, long long count) {
  return lhs.repeat(count);
}

Markup operator*(long long count, const Markup& rhs) {
  return rhs.repeat(count);
}

Markup operator%(const Markup& lhs, const Value& args) {
  return lhs.interpolate(args);
}

bool operator==(const Markup& lhs, const Markup& rhs) {
  return lhs.str() == rhs.str();
}

bool operator!=(const Markup& lhs, const Markup& rhs) {
  return !(lhs == rhs);
}

bool operator<(const Markup& lhs, const Markup& rhs) {
  return lhs.str() < rhs.str();
}

bool operator==(const Markup& lhs, const std::string& rhs) {
  return lhs.str() == rhs;
}

bool operator!=(const Markup& lhs, const std::string& rhs) {
  return !(lhs == rhs);
}

bool operator==(const std::string& lhs, const Markup& rhs) {
  return rhs == lhs;
}

bool operator!=(const std::string& lhs, const Markup& rhs) {
  return !(rhs == lhs);
}

bool operator==(const Markup& lhs, const char* rhs) {
  return rhs != NULL && lhs.str() == rhs;
}

bool operator!=(const Markup& lhs, const char* rhs) {
  return !(lhs == rhs);
}

bool operator==(const char* lhs, const Markup& rhs) {
  return rhs == lhs;
}

bool operator!=(const char* lhs, const Markup& rhs) {
  return !(rhs == lhs);
}

std::ostream& operator<<(std::ostream& os, const Markup& markup) {
  return os << markup.str();
}

}  // namespace markup
