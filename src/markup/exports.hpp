#pragma once

#include <string>
#include <vector>

namespace markup {

// Names of the public types and functions of the markup library.
const std::vector<std::string>& exportedNames();

}  // namespace markup
