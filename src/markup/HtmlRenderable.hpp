#pragma once

#include <string>

namespace markup {

/**
 * Capability interface for objects that know how to render themselves as
 * markup.
 *
 * The string returned by html() is trusted completely: escape(), the
 * Markup constructors and the formatting operations insert it verbatim.
 * Implementations are responsible for escaping any untrusted content they
 * embed.
 */
class HtmlRenderable {
 public:
  virtual ~HtmlRenderable() {}

  virtual std::string html() const = 0;
};

}  // namespace markup
