#include "format.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdio>
#include <limits>
#include <vector>

#include "errors.hpp"
#include "escape.hpp"
#include "utf8.hpp"

namespace markup {

namespace {

const long kMaxWidth = 1000000;

std::string truncateCodePoints(const std::string& s, std::size_t count) {
  std::size_t pos = 0;
  std::size_t n = 0;
  while (pos < s.size() && n < count) {
    pos += utf8::sequenceLength(s, pos);
    ++n;
  }
  return s.substr(0, pos);
}

std::string repeatText(const std::string& s, std::size_t n) {
  std::string out;
  out.reserve(s.size() * n);
  for (std::size_t i = 0; i < n; ++i) {
    out += s;
  }
  return out;
}

bool allDigits(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

// Parse a decimal field index; false on overflow.
bool parseIndex(const std::string& s, std::size_t& out) {
  const std::size_t kMax = std::numeric_limits<std::size_t>::max();
  std::size_t value = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    std::size_t digit = static_cast<std::size_t>(s[i] - '0');
    if (value > (kMax - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

// ==================== PRINTF-STYLE ====================

struct PercentSpec {
  PercentSpec()
      : left(false),
        plus(false),
        space(false),
        alt(false),
        zero(false),
        width(-1),
        precision(-1),
        conv('\0') {}

  bool left;
  bool plus;
  bool space;
  bool alt;
  bool zero;
  long width;
  long precision;
  char conv;
};

std::string padText(const std::string& s, const PercentSpec& spec) {
  if (spec.width < 0) {
    return s;
  }
  std::size_t len = utf8::length(s);
  std::size_t width = static_cast<std::size_t>(spec.width);
  if (width <= len) {
    return s;
  }
  std::string fill(width - len, ' ');
  return spec.left ? s + fill : fill + s;
}

std::string clip(const std::string& s, const PercentSpec& spec) {
  if (spec.precision < 0) {
    return s;
  }
  return truncateCodePoints(s, static_cast<std::size_t>(spec.precision));
}

std::string assembleNumber(const std::string& sign, const std::string& prefix,
                           const std::string& digits,
                           const PercentSpec& spec) {
  std::string body = sign + prefix + digits;
  if (spec.width < 0 || static_cast<std::size_t>(spec.width) <= body.size()) {
    return body;
  }
  std::size_t pad = static_cast<std::size_t>(spec.width) - body.size();
  if (spec.left) {
    return body + std::string(pad, ' ');
  }
  if (spec.zero) {
    return sign + prefix + std::string(pad, '0') + digits;
  }
  return std::string(pad, ' ') + body;
}

std::string percentInteger(long long n, const PercentSpec& spec) {
  unsigned long long mag = n < 0 ? 0ULL - static_cast<unsigned long long>(n)
                                 : static_cast<unsigned long long>(n);
  const char* cfmt = "%llu";
  std::string prefix;
  if (spec.conv == 'o') {
    cfmt = "%llo";
    prefix = spec.alt ? "0o" : "";
  } else if (spec.conv == 'x') {
    cfmt = "%llx";
    prefix = spec.alt ? "0x" : "";
  } else if (spec.conv == 'X') {
    cfmt = "%llX";
    prefix = spec.alt ? "0X" : "";
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), cfmt, mag);
  std::string digits(buf);
  if (spec.precision > 0 &&
      digits.size() < static_cast<std::size_t>(spec.precision)) {
    digits.insert(0, static_cast<std::size_t>(spec.precision) - digits.size(),
                  '0');
  }
  std::string sign;
  if (n < 0) {
    sign = "-";
  } else if (spec.plus) {
    sign = "+";
  } else if (spec.space) {
    sign = " ";
  }
  return assembleNumber(sign, prefix, digits, spec);
}

std::string percentFloat(double d, const PercentSpec& spec) {
  std::string cfmt = "%";
  if (spec.left) {
    cfmt += '-';
  }
  if (spec.plus) {
    cfmt += '+';
  }
  if (spec.space) {
    cfmt += ' ';
  }
  if (spec.alt) {
    cfmt += '#';
  }
  if (spec.zero) {
    cfmt += '0';
  }
  if (spec.width >= 0) {
    cfmt += fmt::format("{}", spec.width);
  }
  cfmt += fmt::format(".{}", spec.precision >= 0 ? spec.precision : 6L);
  cfmt += spec.conv;

  int needed = std::snprintf(NULL, 0, cfmt.c_str(), d);
  if (needed < 0) {
    throw FormatError("cannot format float with '" + cfmt + "'");
  }
  std::vector<char> buf(static_cast<std::size_t>(needed) + 1);
  std::snprintf(&buf[0], buf.size(), cfmt.c_str(), d);
  return std::string(&buf[0], static_cast<std::size_t>(needed));
}

std::string percentChar(const Value& value) {
  if (value.kind() == Value::INT || value.kind() == Value::BOOL) {
    long long cp = value.asInt();
    std::string out;
    if (cp < 0 || !utf8::encode(out, static_cast<unsigned long>(cp))) {
      throw ValueError("%c arg not in range(0x110000)");
    }
    return out;
  }
  if ((value.kind() == Value::STRING || value.isSafe()) &&
      utf8::length(value.text()) == 1) {
    return value.text();
  }
  throw TypeError("%c requires an int or a single character");
}

class PercentFormatter {
 public:
  PercentFormatter(const std::string& tmpl, const Value& args)
      : tmpl_(tmpl), mapping_(NULL), next_(0), pos_(0) {
    if (args.kind() == Value::LIST) {
      for (std::size_t i = 0; i < args.size(); ++i) {
        tuple_.push_back(args.at(i));
      }
    } else {
      tuple_.push_back(args);
    }
    if (args.kind() == Value::MAP) {
      mapping_ = &args;
    }
  }

  std::string run() {
    std::string out;
    out.reserve(tmpl_.size());
    while (pos_ < tmpl_.size()) {
      std::size_t pct = tmpl_.find('%', pos_);
      if (pct == std::string::npos) {
        out.append(tmpl_, pos_, std::string::npos);
        break;
      }
      out.append(tmpl_, pos_, pct - pos_);
      pos_ = pct + 1;

      PercentSpec spec;
      const Value* keyed = NULL;
      parseSpec(spec, keyed);
      if (spec.conv == '%') {
        out.push_back('%');
        continue;
      }
      const Value& value = keyed ? *keyed : takeArg();
      out += convert(value, spec);
    }
    if (mapping_ == NULL && next_ < tuple_.size()) {
      throw FormatError("not all arguments converted during string formatting");
    }
    return out;
  }

 private:
  const std::string& tmpl_;
  std::vector<Value> tuple_;
  const Value* mapping_;
  std::size_t next_;
  std::size_t pos_;

  const Value& takeArg() {
    if (next_ >= tuple_.size()) {
      throw FormatError("not enough arguments for format string");
    }
    return tuple_[next_++];
  }

  long takeStarArg() {
    const Value& v = takeArg();
    if (v.kind() != Value::INT && v.kind() != Value::BOOL) {
      throw TypeError("* wants int");
    }
    long long n = v.asInt();
    if (n > kMaxWidth || n < -kMaxWidth) {
      throw FormatError("width too big");
    }
    return static_cast<long>(n);
  }

  long parseNumber() {
    long n = 0;
    while (pos_ < tmpl_.size() &&
           std::isdigit(static_cast<unsigned char>(tmpl_[pos_]))) {
      n = n * 10 + (tmpl_[pos_] - '0');
      if (n > kMaxWidth) {
        throw FormatError("width too big");
      }
      ++pos_;
    }
    return n;
  }

  void requireMore() const {
    if (pos_ >= tmpl_.size()) {
      throw FormatError("incomplete format");
    }
  }

  void parseSpec(PercentSpec& spec, const Value*& keyed) {
    requireMore();
    if (tmpl_[pos_] == '(') {
      std::size_t keyStart = ++pos_;
      int depth = 1;
      while (pos_ < tmpl_.size() && depth > 0) {
        if (tmpl_[pos_] == '(') {
          ++depth;
        } else if (tmpl_[pos_] == ')') {
          --depth;
        }
        ++pos_;
      }
      if (depth > 0) {
        throw FormatError("incomplete format key");
      }
      std::string key = tmpl_.substr(keyStart, pos_ - 1 - keyStart);
      if (mapping_ == NULL) {
        throw FormatError("format requires a mapping");
      }
      if (!mapping_->has(key)) {
        throw FormatError("missing key " + quoteText(key));
      }
      keyed = &mapping_->get(key);
    }

    bool flags = true;
    while (flags && pos_ < tmpl_.size()) {
      switch (tmpl_[pos_]) {
        case '-':
          spec.left = true;
          break;
        case '+':
          spec.plus = true;
          break;
        case ' ':
          spec.space = true;
          break;
        case '#':
          spec.alt = true;
          break;
        case '0':
          spec.zero = true;
          break;
        default:
          flags = false;
          continue;
      }
      ++pos_;
    }

    requireMore();
    if (tmpl_[pos_] == '*') {
      ++pos_;
      spec.width = takeStarArg();
      if (spec.width < 0) {
        spec.left = true;
        spec.width = -spec.width;
      }
    } else if (std::isdigit(static_cast<unsigned char>(tmpl_[pos_]))) {
      spec.width = parseNumber();
    }

    requireMore();
    if (tmpl_[pos_] == '.') {
      ++pos_;
      requireMore();
      if (tmpl_[pos_] == '*') {
        ++pos_;
        spec.precision = takeStarArg();
        if (spec.precision < 0) {
          spec.precision = 0;
        }
      } else {
        spec.precision = parseNumber();
      }
    }

    while (pos_ < tmpl_.size() &&
           (tmpl_[pos_] == 'h' || tmpl_[pos_] == 'l' || tmpl_[pos_] == 'L')) {
      ++pos_;
    }
    requireMore();
    spec.conv = tmpl_[pos_++];
  }

  std::string convert(const Value& value, const PercentSpec& spec) const {
    switch (spec.conv) {
      case 's':
        if (value.isSafe()) {
          return padText(clip(value.text(), spec), spec);
        }
        return escapeText(padText(clip(value.str(), spec), spec));
      case 'r':
      case 'a':
        return escapeText(padText(clip(value.repr(), spec), spec));
      case 'c':
        return escapeText(padText(percentChar(value), spec));
      case 'd':
      case 'i':
      case 'u':
        requireNumber(value, spec.conv);
        return percentInteger(value.asInt(), spec);
      case 'o':
      case 'x':
      case 'X':
        if (value.kind() != Value::INT && value.kind() != Value::BOOL) {
          throw TypeError(
              fmt::format("%{} format: an integer is required, not {}",
                          spec.conv, Value::kindName(value.kind())));
        }
        return percentInteger(value.asInt(), spec);
      case 'e':
      case 'E':
      case 'f':
      case 'F':
      case 'g':
      case 'G':
        requireNumber(value, spec.conv);
        return escapeText(percentFloat(value.asFloat(), spec));
      default:
        throw FormatError(fmt::format(
            "unsupported format character '{}' (0x{:x}) at index {}",
            spec.conv, static_cast<unsigned char>(spec.conv), pos_ - 1));
    }
  }

  static void requireNumber(const Value& value, char conv) {
    if (!value.isNumber()) {
      throw TypeError(fmt::format("%{} format: a number is required, not {}",
                                  conv, Value::kindName(value.kind())));
    }
  }
};

// ==================== BRACE-STYLE ====================

// [[fill]align][sign][#][0][width][grouping][.precision][type]
struct FieldSpec {
  FieldSpec()
      : align('\0'),
        sign('\0'),
        alt(false),
        zero(false),
        width(0),
        grouping('\0'),
        precision(-1),
        type('\0') {}

  std::string fill;
  char align;
  char sign;
  bool alt;
  bool zero;
  std::size_t width;
  char grouping;
  long precision;
  char type;
};

bool isAlign(char c) {
  return c == '<' || c == '>' || c == '=' || c == '^';
}

FieldSpec parseFieldSpec(const std::string& spec) {
  FieldSpec out;
  std::size_t pos = 0;
  if (!spec.empty()) {
    std::size_t firstLen = utf8::sequenceLength(spec, 0);
    if (firstLen < spec.size() && isAlign(spec[firstLen])) {
      out.fill = spec.substr(0, firstLen);
      out.align = spec[firstLen];
      pos = firstLen + 1;
    } else if (isAlign(spec[0])) {
      out.align = spec[0];
      pos = 1;
    }
  }
  if (pos < spec.size() &&
      (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) {
    out.sign = spec[pos++];
  }
  if (pos < spec.size() && spec[pos] == '#') {
    out.alt = true;
    ++pos;
  }
  if (pos < spec.size() && spec[pos] == '0') {
    out.zero = true;
    ++pos;
  }
  std::size_t start = pos;
  while (pos < spec.size() &&
         std::isdigit(static_cast<unsigned char>(spec[pos]))) {
    ++pos;
  }
  if (pos > start) {
    std::size_t width = 0;
    if (!parseIndex(spec.substr(start, pos - start), width) ||
        width > static_cast<std::size_t>(kMaxWidth)) {
      throw FormatError("Too many decimal digits in format string");
    }
    out.width = width;
  }
  if (pos < spec.size() && (spec[pos] == ',' || spec[pos] == '_')) {
    out.grouping = spec[pos++];
  }
  if (pos < spec.size() && spec[pos] == '.') {
    ++pos;
    start = pos;
    while (pos < spec.size() &&
           std::isdigit(static_cast<unsigned char>(spec[pos]))) {
      ++pos;
    }
    if (pos == start) {
      throw FormatError("Format specifier missing precision");
    }
    std::size_t precision = 0;
    if (!parseIndex(spec.substr(start, pos - start), precision) ||
        precision > static_cast<std::size_t>(kMaxWidth)) {
      throw FormatError("Too many decimal digits in format string");
    }
    out.precision = static_cast<long>(precision);
  }
  if (pos < spec.size()) {
    out.type = spec[pos++];
  }
  if (pos != spec.size()) {
    throw FormatError("Invalid format specifier '" + spec + "'");
  }
  return out;
}

// Prefix of a rendered number that padding with '=' alignment goes after.
std::size_t signPrefixLength(const std::string& core) {
  std::size_t pos = 0;
  if (pos < core.size() &&
      (core[pos] == '+' || core[pos] == '-' || core[pos] == ' ')) {
    ++pos;
  }
  if (pos + 1 < core.size() && core[pos] == '0' &&
      std::string("xXbBoO").find(core[pos + 1]) != std::string::npos) {
    pos += 2;
  }
  return pos;
}

std::string applyPadding(const std::string& core, const FieldSpec& spec,
                         bool numeric) {
  std::size_t len = utf8::length(core);
  if (spec.width <= len) {
    return core;
  }
  std::size_t pad = spec.width - len;
  char align = spec.align;
  std::string fill = spec.fill;
  if (align == '\0') {
    if (spec.zero && numeric) {
      align = '=';
      if (fill.empty()) {
        fill = "0";
      }
    } else {
      align = numeric ? '>' : '<';
    }
  }
  if (fill.empty()) {
    fill = spec.zero && numeric ? "0" : " ";
  }
  switch (align) {
    case '<':
      return core + repeatText(fill, pad);
    case '^':
      return repeatText(fill, pad / 2) + core +
             repeatText(fill, pad - pad / 2);
    case '=': {
      std::size_t split = signPrefixLength(core);
      return core.substr(0, split) + repeatText(fill, pad) + core.substr(split);
    }
    default:
      return repeatText(fill, pad) + core;
  }
}

std::string numberSpec(const FieldSpec& spec, bool withAlt, char type) {
  std::string out = "{:";
  if (spec.sign != '\0') {
    out += spec.sign;
  }
  if (withAlt && spec.alt) {
    out += '#';
  }
  if (spec.precision >= 0) {
    out += fmt::format(".{}", spec.precision);
  }
  if (type != '\0') {
    out += type;
  }
  out += "}";
  return out;
}

std::string renderFloat(double d, const FieldSpec& spec, const Value& value) {
  char type = spec.type;
  if (type == '\0' && spec.precision < 0 && spec.sign == '\0' && !spec.alt) {
    return value.kind() == Value::FLOAT ? value.str() : Value(d).str();
  }
  if (type == '%') {
    FieldSpec fixed = spec;
    if (fixed.precision < 0) {
      fixed.precision = 6;
    }
    return fmt::format(fmt::runtime(numberSpec(fixed, true, 'f')), d * 100.0) +
           "%";
  }
  if (type == 'n') {
    type = 'g';
  }
  std::string out = fmt::format(fmt::runtime(numberSpec(spec, true, type)), d);
  // Without a presentation type a float always keeps a fractional part.
  if (type == '\0' && out.find_first_of(".en") == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string renderInteger(long long n, const FieldSpec& spec) {
  char type = spec.type;
  if (type == 'c') {
    if (spec.sign != '\0' || spec.alt) {
      throw FormatError("Sign not allowed with integer format specifier 'c'");
    }
    std::string out;
    if (n < 0 || !utf8::encode(out, static_cast<unsigned long>(n))) {
      throw FormatError("%c arg not in range(0x110000)");
    }
    return out;
  }
  if (spec.precision >= 0) {
    throw FormatError("Precision not allowed in integer format specifier");
  }
  if (type == 'n') {
    type = 'd';
  }
  if (type == 'o' && spec.alt) {
    // Octal prefix is "0o", not the C-style leading zero.
    std::string core =
        fmt::format(fmt::runtime(numberSpec(spec, false, 'o')), n);
    std::size_t split = signPrefixLength(core);
    return core.substr(0, split) + "0o" + core.substr(split);
  }
  if (type != '\0' && std::string("dbxXo").find(type) == std::string::npos) {
    throw FormatError(fmt::format(
        "Unknown format code '{}' for object of type 'int'", type));
  }
  return fmt::format(fmt::runtime(numberSpec(spec, true, type)), n);
}

std::string renderText(const std::string& text, const FieldSpec& spec) {
  if (spec.type != '\0' && spec.type != 's') {
    throw FormatError(fmt::format(
        "Unknown format code '{}' for object of type 'str'", spec.type));
  }
  if (spec.sign != '\0') {
    throw FormatError("Sign not allowed in string format specifier");
  }
  if (spec.alt) {
    throw FormatError("Alternate form (#) not allowed in string format "
                      "specifier");
  }
  if (spec.align == '=') {
    throw FormatError("'=' alignment not allowed in string format specifier");
  }
  if (spec.precision >= 0) {
    return truncateCodePoints(text, static_cast<std::size_t>(spec.precision));
  }
  return text;
}

// Render an untagged value with a format specification; the caller escapes.
std::string renderWithSpec(const Value& value, const std::string& specText) {
  if (specText.empty()) {
    return value.str();
  }
  FieldSpec spec = parseFieldSpec(specText);
  if (spec.grouping != '\0') {
    throw FormatError("Thousands separators are not supported");
  }
  std::string core;
  bool numeric = true;
  try {
    switch (value.kind()) {
      case Value::BOOL:
      case Value::INT:
        if (spec.type != '\0' &&
            std::string("eEfFgG%").find(spec.type) != std::string::npos) {
          core = renderFloat(value.asFloat(), spec, value);
        } else {
          core = renderInteger(value.asInt(), spec);
        }
        break;
      case Value::FLOAT:
        if (spec.type != '\0' &&
            std::string("eEfFgGn%").find(spec.type) == std::string::npos) {
          throw FormatError(fmt::format(
              "Unknown format code '{}' for object of type 'float'",
              spec.type));
        }
        core = renderFloat(value.asFloat(), spec, value);
        break;
      case Value::STRING:
        numeric = false;
        core = renderText(value.text(), spec);
        break;
      default:
        throw FormatError(std::string("unsupported format string passed to ") +
                          Value::kindName(value.kind()) + " value");
    }
  } catch (const fmt::format_error& e) {
    throw FormatError(e.what());
  }
  return applyPadding(core, spec, numeric);
}

class BraceFormatter {
 public:
  explicit BraceFormatter(const FormatArgs& args)
      : args_(args), numbering_(UNDECIDED), nextAuto_(0) {}

  // depth 0 renders the template itself; depth 1 expands fields nested in
  // a format specification, whose output is raw text rather than markup.
  std::string run(const std::string& tmpl, int depth) {
    if (depth > 1) {
      throw FormatError("Max string recursion exceeded");
    }
    std::string out;
    out.reserve(tmpl.size());
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
      std::size_t brace = tmpl.find_first_of("{}", pos);
      if (brace == std::string::npos) {
        out.append(tmpl, pos, std::string::npos);
        break;
      }
      out.append(tmpl, pos, brace - pos);
      char c = tmpl[brace];
      if (brace + 1 < tmpl.size() && tmpl[brace + 1] == c) {
        out.push_back(c);
        pos = brace + 2;
        continue;
      }
      if (c == '}') {
        throw FormatError("Single '}' encountered in format string");
      }
      std::size_t end = findFieldEnd(tmpl, brace + 1);
      out += renderField(tmpl.substr(brace + 1, end - brace - 1), depth);
      pos = end + 1;
    }
    return out;
  }

 private:
  enum Numbering { UNDECIDED, AUTOMATIC, MANUAL };

  const FormatArgs& args_;
  Numbering numbering_;
  std::size_t nextAuto_;

  static std::size_t findFieldEnd(const std::string& tmpl, std::size_t pos) {
    int depth = 1;
    for (; pos < tmpl.size(); ++pos) {
      if (tmpl[pos] == '{') {
        ++depth;
      } else if (tmpl[pos] == '}') {
        if (--depth == 0) {
          return pos;
        }
      }
    }
    if (depth > 1) {
      throw FormatError("unmatched '{' in format spec");
    }
    throw FormatError("expected '}' before end of string");
  }

  std::string renderField(const std::string& field, int depth) {
    // Split "name!conv:spec"; '!' and ':' inside [...] belong to the name.
    std::size_t pos = 0;
    int brackets = 0;
    while (pos < field.size()) {
      char c = field[pos];
      if (c == '[') {
        ++brackets;
      } else if (c == ']') {
        --brackets;
      } else if (brackets == 0 && (c == '!' || c == ':')) {
        break;
      }
      ++pos;
    }
    std::string name = field.substr(0, pos);
    char conversion = '\0';
    std::string spec;
    if (pos < field.size() && field[pos] == '!') {
      if (pos + 1 >= field.size()) {
        throw FormatError("end of string while looking for conversion "
                          "specifier");
      }
      conversion = field[pos + 1];
      pos += 2;
      if (pos < field.size() && field[pos] != ':') {
        throw FormatError("expected ':' after conversion specifier");
      }
    }
    if (pos < field.size() && field[pos] == ':') {
      spec = field.substr(pos + 1);
    }
    Value value = resolve(name);
    if (spec.find_first_of("{}") != std::string::npos) {
      spec = run(spec, depth + 1);
    }
    switch (conversion) {
      case '\0':
        break;
      case 's':
        value = Value(value.str());
        break;
      case 'r':
      case 'a':
        value = Value(value.repr());
        break;
      default:
        throw FormatError(fmt::format(
            "Unknown conversion specifier {}", conversion));
    }

    if (value.isSafe()) {
      if (!spec.empty()) {
        throw FormatError("Format specifier given, but markup values do not "
                          "support format specifiers");
      }
      return value.text();
    }
    std::string rendered = renderWithSpec(value, spec);
    return depth == 0 ? escapeText(rendered) : rendered;
  }

  Value resolve(const std::string& name) {
    std::size_t end = name.find_first_of(".[");
    std::string first = name.substr(0, end);
    Value value;
    if (first.empty()) {
      if (numbering_ == MANUAL) {
        throw FormatError("cannot switch from manual field specification to "
                          "automatic field numbering");
      }
      numbering_ = AUTOMATIC;
      value = args_.positional(nextAuto_++);
    } else if (allDigits(first)) {
      if (numbering_ == AUTOMATIC) {
        throw FormatError("cannot switch from automatic field numbering to "
                          "manual field specification");
      }
      numbering_ = MANUAL;
      std::size_t index = 0;
      if (!parseIndex(first, index)) {
        throw FormatError("Too many decimal digits in format string");
      }
      value = args_.positional(index);
    } else {
      value = args_.named(first);
    }

    std::size_t pos = end;
    while (pos != std::string::npos && pos < name.size()) {
      if (name[pos] == '.') {
        std::size_t next = name.find_first_of(".[", pos + 1);
        std::string attr = name.substr(pos + 1, next == std::string::npos
                                                    ? std::string::npos
                                                    : next - pos - 1);
        if (attr.empty()) {
          throw FormatError("Empty attribute in format string");
        }
        value = member(value, attr, true);
        pos = next;
      } else if (name[pos] == '[') {
        std::size_t close = name.find(']', pos + 1);
        if (close == std::string::npos) {
          throw FormatError("Missing ']' in format string");
        }
        std::string key = name.substr(pos + 1, close - pos - 1);
        if (key.empty()) {
          throw FormatError("Empty attribute in format string");
        }
        value = item(value, key);
        pos = close + 1;
        if (pos < name.size() && name[pos] != '.' && name[pos] != '[') {
          throw FormatError("Only '.' or '[' may follow ']' in format field "
                            "specifier");
        }
      } else {
        throw FormatError("Invalid field name '" + name + "'");
      }
    }
    return value;
  }

  static Value member(const Value& value, const std::string& key,
                      bool attribute) {
    if (value.kind() != Value::MAP) {
      throw FormatError(std::string("'") + Value::kindName(value.kind()) +
                        (attribute ? "' object has no attribute "
                                   : "' object is not subscriptable by ") +
                        quoteText(key));
    }
    if (!value.has(key)) {
      throw FormatError((attribute ? "no attribute " : "missing key ") +
                        quoteText(key));
    }
    return value.get(key);
  }

  static Value item(const Value& value, const std::string& key) {
    if (value.kind() == Value::LIST && allDigits(key)) {
      std::size_t index = 0;
      if (!parseIndex(key, index) || index >= value.size()) {
        throw FormatError("list index out of range");
      }
      return value.at(index);
    }
    return member(value, key, false);
  }
};

}  // namespace

std::string percentFormat(const std::string& tmpl, const Value& args) {
  PercentFormatter formatter(tmpl, args);
  return formatter.run();
}

std::string braceFormat(const std::string& tmpl, const FormatArgs& args) {
  BraceFormatter formatter(args);
  return formatter.run(tmpl, 0);
}

}  // namespace markup
