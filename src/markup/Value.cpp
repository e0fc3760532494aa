#include "Value.hpp"

#include <fmt/format.h>

#include <climits>
#include <cstdio>

#include "HtmlRenderable.hpp"
#include "Markup.hpp"
#include "errors.hpp"

namespace markup {

Value::Value()
    : kind_(NONE), int_(0), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(bool b)
    : kind_(BOOL), int_(b ? 1 : 0), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(int n)
    : kind_(INT), int_(n), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(unsigned int n)
    : kind_(INT), int_(n), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(long n)
    : kind_(INT), int_(n), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(unsigned long n)
    : kind_(INT),
      int_(static_cast<long long>(n)),
      float_(0.0),
      items_(NULL),
      fields_(NULL) {
  if (n > static_cast<unsigned long>(LLONG_MAX)) {
    throw ValueError("integer value too large");
  }
}

Value::Value(long long n)
    : kind_(INT), int_(n), float_(0.0), items_(NULL), fields_(NULL) {}

Value::Value(unsigned long long n)
    : kind_(INT),
      int_(static_cast<long long>(n)),
      float_(0.0),
      items_(NULL),
      fields_(NULL) {
  if (n > static_cast<unsigned long long>(LLONG_MAX)) {
    throw ValueError("integer value too large");
  }
}

Value::Value(double d)
    : kind_(FLOAT), int_(0), float_(d), items_(NULL), fields_(NULL) {}

Value::Value(const char* text)
    : kind_(text ? STRING : NONE),
      int_(0),
      float_(0.0),
      text_(text ? text : ""),
      items_(NULL),
      fields_(NULL) {}

Value::Value(const std::string& text)
    : kind_(STRING),
      int_(0),
      float_(0.0),
      text_(text),
      items_(NULL),
      fields_(NULL) {}

Value::Value(const Markup& markup)
    : kind_(MARKUP),
      int_(0),
      float_(0.0),
      text_(markup.str()),
      items_(NULL),
      fields_(NULL) {}

Value::Value(const HtmlRenderable& obj)
    : kind_(MARKUP),
      int_(0),
      float_(0.0),
      text_(obj.html()),
      items_(NULL),
      fields_(NULL) {}

Value::Value(const Value& other)
    : kind_(NONE), int_(0), float_(0.0), items_(NULL), fields_(NULL) {
  copyFrom(other);
}

Value& Value::operator=(const Value& other) {
  if (this != &other) {
    // Build the copy first so that `other` may be owned by this value.
    Value tmp(other);
    release();
    kind_ = tmp.kind_;
    int_ = tmp.int_;
    float_ = tmp.float_;
    text_.swap(tmp.text_);
    items_ = tmp.items_;
    fields_ = tmp.fields_;
    tmp.items_ = NULL;
    tmp.fields_ = NULL;
  }
  return *this;
}

Value::~Value() {
  release();
}

void Value::copyFrom(const Value& other) {
  kind_ = other.kind_;
  int_ = other.int_;
  float_ = other.float_;
  text_ = other.text_;
  if (other.items_) {
    items_ = new std::vector<Value>(*other.items_);
  }
  if (other.fields_) {
    fields_ = new std::map<std::string, Value>(*other.fields_);
  }
}

void Value::release() {
  delete items_;
  delete fields_;
  items_ = NULL;
  fields_ = NULL;
}

Value Value::none() {
  return Value();
}

Value Value::list() {
  Value v;
  v.kind_ = LIST;
  v.items_ = new std::vector<Value>();
  return v;
}

Value Value::map() {
  Value v;
  v.kind_ = MAP;
  v.fields_ = new std::map<std::string, Value>();
  return v;
}

Value& Value::append(const Value& item) {
  if (kind_ != LIST) {
    throw TypeError(std::string("cannot append to ") + kindName(kind_));
  }
  items_->push_back(item);
  return *this;
}

Value& Value::set(const std::string& key, const Value& item) {
  if (kind_ != MAP) {
    throw TypeError(std::string("cannot set a member on ") + kindName(kind_));
  }
  (*fields_)[key] = item;
  return *this;
}

Value::Kind Value::kind() const {
  return kind_;
}

bool Value::isNone() const {
  return kind_ == NONE;
}

bool Value::isSafe() const {
  return kind_ == MARKUP;
}

bool Value::isNumber() const {
  return kind_ == BOOL || kind_ == INT || kind_ == FLOAT;
}

std::size_t Value::size() const {
  if (kind_ == LIST) {
    return items_->size();
  }
  if (kind_ == MAP) {
    return fields_->size();
  }
  return 0;
}

const Value& Value::at(std::size_t index) const {
  if (kind_ != LIST) {
    throw TypeError(std::string("'") + kindName(kind_) +
                    "' object is not indexable");
  }
  if (index >= items_->size()) {
    throw LookupError(fmt::format("list index {} out of range", index));
  }
  return (*items_)[index];
}

const Value& Value::get(const std::string& key) const {
  if (kind_ != MAP) {
    throw TypeError(std::string("'") + kindName(kind_) +
                    "' object has no member '" + key + "'");
  }
  std::map<std::string, Value>::const_iterator it = fields_->find(key);
  if (it == fields_->end()) {
    throw LookupError("key not found: " + quoteText(key));
  }
  return it->second;
}

bool Value::has(const std::string& key) const {
  return kind_ == MAP && fields_->find(key) != fields_->end();
}

std::vector<std::string> Value::keys() const {
  std::vector<std::string> out;
  if (kind_ == MAP) {
    for (std::map<std::string, Value>::const_iterator it = fields_->begin();
         it != fields_->end(); ++it) {
      out.push_back(it->first);
    }
  }
  return out;
}

bool Value::asBool() const {
  switch (kind_) {
    case NONE:
      return false;
    case BOOL:
    case INT:
      return int_ != 0;
    case FLOAT:
      return float_ != 0.0;
    case STRING:
    case MARKUP:
      return !text_.empty();
    case LIST:
    case MAP:
      return size() != 0;
  }
  return false;
}

long long Value::asInt() const {
  if (kind_ == BOOL || kind_ == INT) {
    return int_;
  }
  if (kind_ == FLOAT) {
    if (float_ != float_) {
      throw ValueError("cannot convert float NaN to integer");
    }
    if (float_ >= 9223372036854775808.0 || float_ < -9223372036854775808.0) {
      throw ValueError("float value out of integer range");
    }
    return static_cast<long long>(float_);
  }
  throw TypeError(std::string("a number is required, not ") +
                  kindName(kind_));
}

double Value::asFloat() const {
  if (kind_ == BOOL || kind_ == INT) {
    return static_cast<double>(int_);
  }
  if (kind_ == FLOAT) {
    return float_;
  }
  throw TypeError(std::string("a number is required, not ") +
                  kindName(kind_));
}

const std::string& Value::text() const {
  if (kind_ != STRING && kind_ != MARKUP) {
    throw TypeError(std::string("expected text, not ") + kindName(kind_));
  }
  return text_;
}

std::string Value::str() const {
  switch (kind_) {
    case NONE:
      return "None";
    case BOOL:
      return int_ ? "True" : "False";
    case INT:
      return fmt::format("{}", int_);
    case FLOAT: {
      std::string out = fmt::format("{}", float_);
      // Keep floats distinguishable from integers: 1.0 rather than 1.
      if (out.find_first_of(".en") == std::string::npos) {
        out += ".0";
      }
      return out;
    }
    case STRING:
    case MARKUP:
      return text_;
    case LIST: {
      std::string out = "[";
      for (std::size_t i = 0; i < items_->size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += (*items_)[i].repr();
      }
      out += "]";
      return out;
    }
    case MAP: {
      std::string out = "{";
      for (std::map<std::string, Value>::const_iterator it = fields_->begin();
           it != fields_->end(); ++it) {
        if (it != fields_->begin()) {
          out += ", ";
        }
        out += quoteText(it->first) + ": " + it->second.repr();
      }
      out += "}";
      return out;
    }
  }
  return std::string();
}

std::string Value::repr() const {
  if (kind_ == STRING) {
    return quoteText(text_);
  }
  if (kind_ == MARKUP) {
    return "Markup(" + quoteText(text_) + ")";
  }
  return str();
}

const char* Value::kindName(Kind kind) {
  switch (kind) {
    case NONE:
      return "none";
    case BOOL:
      return "bool";
    case INT:
      return "int";
    case FLOAT:
      return "float";
    case STRING:
      return "str";
    case MARKUP:
      return "markup";
    case LIST:
      return "list";
    case MAP:
      return "map";
  }
  return "unknown";
}

std::string quoteText(const std::string& text) {
  char quote = '\'';
  if (text.find('\'') != std::string::npos &&
      text.find('"') == std::string::npos) {
    quote = '"';
  }
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back(quote);
  for (std::size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == static_cast<unsigned char>(quote) || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c == '\n') {
      out.append("\\n");
    } else if (c == '\r') {
      out.append("\\r");
    } else if (c == '\t') {
      out.append("\\t");
    } else if (c < 0x20 || c == 0x7F) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02x", c);
      out.append(buf);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  out.push_back(quote);
  return out;
}

}  // namespace markup
