#include "FormatArgs.hpp"

#include "errors.hpp"

namespace markup {

FormatArgs::FormatArgs() {}

FormatArgs::FormatArgs(const FormatArgs& other)
    : positional_(other.positional_), named_(other.named_) {}

FormatArgs& FormatArgs::operator=(const FormatArgs& other) {
  if (this != &other) {
    positional_ = other.positional_;
    named_ = other.named_;
  }
  return *this;
}

FormatArgs::~FormatArgs() {}

FormatArgs FormatArgs::fromMap(const Value& mapping) {
  if (mapping.kind() != Value::MAP) {
    throw TypeError(std::string("format mapping must be a map, not ") +
                    Value::kindName(mapping.kind()));
  }
  FormatArgs args;
  std::vector<std::string> keys = mapping.keys();
  for (std::size_t i = 0; i < keys.size(); ++i) {
    args.named(keys[i], mapping.get(keys[i]));
  }
  return args;
}

FormatArgs& FormatArgs::arg(const Value& value) {
  positional_.push_back(value);
  return *this;
}

FormatArgs& FormatArgs::named(const std::string& name, const Value& value) {
  named_[name] = value;
  return *this;
}

const Value& FormatArgs::positional(std::size_t index) const {
  if (index >= positional_.size()) {
    throw FormatError("Replacement index " + Value(index).str() +
                      " out of range for positional args");
  }
  return positional_[index];
}

const Value& FormatArgs::named(const std::string& name) const {
  std::map<std::string, Value>::const_iterator it = named_.find(name);
  if (it == named_.end()) {
    throw FormatError("missing named argument " + quoteText(name));
  }
  return it->second;
}

}  // namespace markup
