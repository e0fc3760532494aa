#include "escape.hpp"

#include <cstring>

namespace markup {

namespace {

const char kSpecialChars[] = "&<>'\"";

struct Entity {
  const char* name;
  char replacement;
};

// Entities understood by unescapeText().
const Entity kEntities[] = {
    {"&amp;", '&'},  {"&lt;", '<'},   {"&gt;", '>'},   {"&#39;", '\''},
    {"&#34;", '"'},  {"&quot;", '"'}, {"&apos;", '\''}, {"&#x27;", '\''},
    {"&#x22;", '"'},
};

const std::size_t kEntityCount = sizeof(kEntities) / sizeof(kEntities[0]);

}  // namespace

std::string escapeText(const std::string& s) {
  std::size_t first = s.find_first_of(kSpecialChars);
  if (first == std::string::npos) {
    return s;
  }
  std::string out;
  out.reserve(s.size() + s.size() / 8 + 8);
  out.append(s, 0, first);
  for (std::size_t i = first; i < s.size(); ++i) {
    char c = s[i];
    switch (c) {
      case '&':
        out.append("&amp;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      case '"':
        out.append("&#34;");
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

std::string unescapeText(const std::string& s) {
  std::size_t amp = s.find('&');
  if (amp == std::string::npos) {
    return s;
  }
  std::string out;
  out.reserve(s.size());
  out.append(s, 0, amp);
  std::size_t i = amp;
  while (i < s.size()) {
    if (s[i] != '&') {
      out.push_back(s[i]);
      ++i;
      continue;
    }
    bool matched = false;
    for (std::size_t e = 0; e < kEntityCount; ++e) {
      std::size_t len = std::strlen(kEntities[e].name);
      if (s.compare(i, len, kEntities[e].name) == 0) {
        out.push_back(kEntities[e].replacement);
        i += len;
        matched = true;
        break;
      }
    }
    if (!matched) {
      out.push_back('&');
      ++i;
    }
  }
  return out;
}

Markup escape(const Value& value) {
  if (value.isSafe()) {
    return Markup(value.text());
  }
  if (value.kind() == Value::STRING) {
    return Markup(escapeText(value.text()));
  }
  return Markup(escapeText(value.str()));
}

Markup escapeSilent(const Value& value) {
  if (value.isNone()) {
    return Markup();
  }
  return escape(value);
}

Value softStr(const Value& value) {
  if (value.isSafe() || value.kind() == Value::STRING) {
    return value;
  }
  return Value(value.str());
}

}  // namespace markup
