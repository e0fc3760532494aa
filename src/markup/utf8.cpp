#include "utf8.hpp"

namespace markup {
namespace utf8 {

namespace {
bool isContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}
}  // namespace

std::size_t sequenceLength(const std::string& s, std::size_t pos) {
  unsigned char lead = static_cast<unsigned char>(s[pos]);
  std::size_t len = 1;
  if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
  } else if (lead >= 0xE0) {
    len = (lead <= 0xEF) ? 3 : 1;
  } else if (lead >= 0xC2) {
    len = 2;
  }
  if (pos + len > s.size()) {
    return 1;
  }
  for (std::size_t i = 1; i < len; ++i) {
    if (!isContinuation(static_cast<unsigned char>(s[pos + i]))) {
      return 1;
    }
  }
  return len;
}

std::vector<std::size_t> boundaries(const std::string& s) {
  std::vector<std::size_t> out;
  out.reserve(s.size() + 1);
  std::size_t pos = 0;
  while (pos < s.size()) {
    out.push_back(pos);
    pos += sequenceLength(s, pos);
  }
  out.push_back(s.size());
  return out;
}

std::size_t length(const std::string& s) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < s.size()) {
    pos += sequenceLength(s, pos);
    ++count;
  }
  return count;
}

bool encode(std::string& out, unsigned long cp) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return false;
  }
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return true;
}

}  // namespace utf8
}  // namespace markup
