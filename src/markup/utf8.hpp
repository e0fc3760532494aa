#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace markup {
namespace utf8 {

// Number of bytes in the UTF-8 sequence that starts at `pos`. Malformed or
// truncated sequences count as a single byte so that every input has a
// well-defined code point split.
std::size_t sequenceLength(const std::string& s, std::size_t pos);

// Byte offset of every code point in `s`, followed by s.size().
std::vector<std::size_t> boundaries(const std::string& s);

// Number of code points in `s`.
std::size_t length(const std::string& s);

// Append the UTF-8 encoding of `cp` to `out`. Returns false (and appends
// nothing) if `cp` is not a valid code point.
bool encode(std::string& out, unsigned long cp);

}  // namespace utf8
}  // namespace markup
