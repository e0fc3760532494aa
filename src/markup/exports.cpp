#include "exports.hpp"

namespace markup {

namespace {
const char* const kExportedNames[] = {"Markup",
                                      "escape",
                                      "escapeSilent",
                                      "softStr",
                                      "HtmlRenderable",
                                      "Value",
                                      "FormatArgs",
                                      "Error",
                                      "FormatError",
                                      "TypeError",
                                      "ValueError",
                                      "LookupError"};
}  // namespace

const std::vector<std::string>& exportedNames() {
  static const std::vector<std::string> names(
      kExportedNames,
      kExportedNames + sizeof(kExportedNames) / sizeof(kExportedNames[0]));
  return names;
}

}  // namespace markup
