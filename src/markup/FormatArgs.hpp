#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "Value.hpp"

namespace markup {

/**
 * Positional and named arguments for Markup::format().
 *
 * Built by chaining:
 *   FormatArgs().arg("<foo>").arg(Markup("<bar>")).named("user", name)
 */
class FormatArgs {
 public:
  FormatArgs();
  FormatArgs(const FormatArgs& other);
  FormatArgs& operator=(const FormatArgs& other);
  ~FormatArgs();

  // Named arguments taken from the members of a MAP value.
  static FormatArgs fromMap(const Value& mapping);

  FormatArgs& arg(const Value& value);
  FormatArgs& named(const std::string& name, const Value& value);

  const Value& positional(std::size_t index) const;
  const Value& named(const std::string& name) const;

 private:
  std::vector<Value> positional_;
  std::map<std::string, Value> named_;
};

}  // namespace markup
