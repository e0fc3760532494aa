#include "errors.hpp"

namespace markup {

Error::Error(const std::string& message) : std::runtime_error(message) {}

FormatError::FormatError(const std::string& message) : Error(message) {}

TypeError::TypeError(const std::string& message) : Error(message) {}

ValueError::ValueError(const std::string& message) : Error(message) {}

LookupError::LookupError(const std::string& message) : Error(message) {}

}  // namespace markup
