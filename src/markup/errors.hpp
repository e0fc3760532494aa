#pragma once

#include <stdexcept>
#include <string>

namespace markup {

// Base class for every error raised by the markup library.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message);
};

// Template and argument mismatches: missing or extra arguments, unknown
// keys, malformed placeholders, invalid format specifications.
class FormatError : public Error {
 public:
  explicit FormatError(const std::string& message);
};

// An operand of the wrong kind (e.g. a string given to "%d").
class TypeError : public Error {
 public:
  explicit TypeError(const std::string& message);
};

// An operand of the right kind with an unusable value (e.g. a negative
// repeat count or an empty separator).
class ValueError : public Error {
 public:
  explicit ValueError(const std::string& message);
};

// Index or key not present in a Value or Markup.
class LookupError : public Error {
 public:
  explicit LookupError(const std::string& message);
};

}  // namespace markup
