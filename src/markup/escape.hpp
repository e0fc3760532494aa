#pragma once

#include <string>

#include "Markup.hpp"
#include "Value.hpp"

namespace markup {

/**
 * Replace the markup-special characters of `s` with entities:
 * - & → &amp;
 * - > → &gt;
 * - < → &lt;
 * - ' → &#39;
 * - " → &#34;
 *
 * Every other byte, including multi-byte UTF-8 sequences, is copied
 * unchanged.
 *
 * @param s The raw text
 * @return The escaped text
 */
std::string escapeText(const std::string& s);

/**
 * Replace the entities produced by escapeText() (and the aliases &quot;,
 * &apos;, &#x27;, &#x22;) with their characters. Unknown entities are left
 * as they are.
 *
 * @param s The escaped text
 * @return The plain text; it may contain markup-special characters again
 */
std::string unescapeText(const std::string& s);

/**
 * Convert any value to safe markup.
 *
 * Values that already carry the safety tag (Markup, HtmlRenderable output)
 * are returned unchanged; everything else is converted with Value::str()
 * and escaped.
 */
Markup escape(const Value& value);

// Like escape(), but a NONE value yields an empty Markup instead of "None".
Markup escapeSilent(const Value& value);

// Text conversion that keeps safe values safe and never escapes.
Value softStr(const Value& value);

}  // namespace markup
