#pragma once

#include <string>

#include "FormatArgs.hpp"
#include "Value.hpp"

namespace markup {

/**
 * printf-style interpolation ("%s", "%(name)s", "%.2f", ...).
 *
 * The template is trusted text and is copied verbatim. Each conversion is
 * rendered first (width, precision and type applied to the argument) and
 * the resulting text is escaped; safe arguments substituted with "%s" are
 * inserted as they are.
 *
 * @param tmpl Trusted template text
 * @param args A LIST of positional arguments, a MAP for "%(key)s"
 * conversions, or any other value as the single argument
 * @return Safe text
 * @throws FormatError on argument/placeholder mismatches
 * @throws TypeError when a numeric conversion gets a non-number
 */
std::string percentFormat(const std::string& tmpl, const Value& args);

/**
 * Brace-style formatting ("{0}", "{}", "{name[0].attr!r:>10}", ...).
 *
 * Field lookups are resolved first, the value is rendered with its format
 * specification, then the text is escaped. Safe arguments are inserted
 * verbatim and do not accept a format specification.
 *
 * @param tmpl Trusted template text
 * @param args Positional and named arguments
 * @return Safe text
 * @throws FormatError on any template or argument error
 */
std::string braceFormat(const std::string& tmpl, const FormatArgs& args);

}  // namespace markup
