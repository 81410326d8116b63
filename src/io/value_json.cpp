#include "asymunc/io/value_json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>

#include "asymunc/core/errors.hpp"

namespace asymunc {
namespace {

struct Field {
  std::string text;
  bool quoted = false;
};

void write_number(std::ostringstream& out, double value) {
  if (std::isinf(value)) {
    out << (value < 0.0 ? "\"-inf\"" : "\"inf\"");
    return;
  }
  out << value;
}

class JsonCursor {
 public:
  explicit JsonCursor(std::string_view text) : text_(text) {}

  void skip_whitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_whitespace();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void expect(char c) {
    if (!consume(c)) {
      fail(std::string("expected '") + c + "'");
    }
  }

  bool at_end() {
    skip_whitespace();
    return pos_ >= text_.size();
  }

  std::string parse_string() {
    skip_whitespace();
    if (pos_ >= text_.size() || text_[pos_] != '"') {
      fail("expected string");
    }
    ++pos_;
    std::string out;
    while (pos_ < text_.size() && text_[pos_] != '"') {
      if (text_[pos_] == '\\') {
        fail("escape sequences are not supported");
      }
      out.push_back(text_[pos_++]);
    }
    if (pos_ >= text_.size()) {
      fail("unterminated string");
    }
    ++pos_;
    return out;
  }

  Field parse_scalar() {
    skip_whitespace();
    if (pos_ < text_.size() && text_[pos_] == '"') {
      return Field{parse_string(), true};
    }
    const std::size_t begin = pos_;
    if (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0) {
      while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
      const std::string_view word = text_.substr(begin, pos_ - begin);
      if (word != "true" && word != "false") {
        fail("unexpected literal " + std::string(word));
      }
      return Field{std::string(word), false};
    }
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' || c == '.' || c == 'e' ||
          c == 'E') {
        ++pos_;
        continue;
      }
      break;
    }
    if (begin == pos_) {
      fail("expected number or string");
    }
    return Field{std::string(text_.substr(begin, pos_ - begin)), false};
  }

  std::map<std::string, Field> parse_object() {
    std::map<std::string, Field> fields;
    expect('{');
    if (consume('}')) {
      return fields;
    }
    do {
      std::string key = parse_string();
      expect(':');
      fields[std::move(key)] = parse_scalar();
    } while (consume(','));
    expect('}');
    return fields;
  }

  [[noreturn]] void fail(const std::string& message) const {
    std::ostringstream out;
    out << "Malformed value JSON at offset " << pos_ << ": " << message;
    throw InvalidParameterError(out.str());
  }

 private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

double field_number(const std::map<std::string, Field>& fields, const std::string& key, double fallback, bool required) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    if (required) {
      throw InvalidParameterError("Value JSON is missing \"" + key + "\"");
    }
    return fallback;
  }

  const Field& field = it->second;
  if (field.quoted) {
    if (field.text == "inf") {
      return std::numeric_limits<double>::infinity();
    }
    if (field.text == "-inf") {
      return -std::numeric_limits<double>::infinity();
    }
    throw InvalidParameterError("Value JSON field \"" + key + "\" is not a number");
  }

  double value = 0.0;
  const char* begin = field.text.data();
  const char* end = begin + field.text.size();
  const auto result = std::from_chars(begin, end, value);
  if (result.ec != std::errc{} || result.ptr != end) {
    throw InvalidParameterError("Value JSON field \"" + key + "\" is not a number: " + field.text);
  }
  return value;
}

bool field_flag(const std::map<std::string, Field>& fields, const std::string& key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return false;
  }
  if (it->second.quoted || (it->second.text != "true" && it->second.text != "false")) {
    throw InvalidParameterError("Value JSON field \"" + key + "\" must be true or false");
  }
  return it->second.text == "true";
}

UncertainValue value_from_fields(const std::map<std::string, Field>& fields) {
  ValueSpec spec;
  spec.nominal = field_number(fields, "nominal", 0.0, true);
  spec.lower_uncertainty = field_number(fields, "lower_uncertainty", 0.0, true);
  spec.upper_uncertainty = field_number(fields, "upper_uncertainty", 0.0, true);
  spec.lower_limit = field_number(fields, "lower_limit", spec.lower_limit, false);
  spec.upper_limit = field_number(fields, "upper_limit", spec.upper_limit, false);

  spec.conserve_mean = field_flag(fields, "conserve_mean");

  if (const auto it = fields.find("distribution_kind"); it != fields.end()) {
    if (!it->second.quoted) {
      throw InvalidParameterError("Value JSON field \"distribution_kind\" must be a string");
    }
    spec.kind = parse_distribution_kind(it->second.text);
  }

  if (const auto it = fields.find("seed"); it != fields.end()) {
    std::uint64_t seed = 0;
    const char* begin = it->second.text.data();
    const char* end = begin + it->second.text.size();
    const auto result = std::from_chars(begin, end, seed);
    if (it->second.quoted || result.ec != std::errc{} || result.ptr != end) {
      throw InvalidParameterError("Value JSON field \"seed\" must be a non-negative integer");
    }
    spec.seed = seed;
  }

  return UncertainValue(spec);
}

}  // namespace

std::string to_json(const UncertainValue& value) {
  std::ostringstream out;
  out.precision(std::numeric_limits<double>::max_digits10);
  out << "{\"nominal\":";
  write_number(out, value.nominal());
  out << ",\"lower_uncertainty\":";
  write_number(out, value.lower_uncertainty());
  out << ",\"upper_uncertainty\":";
  write_number(out, value.upper_uncertainty());
  out << ",\"distribution_kind\":\"" << distribution_name(value.kind()) << "\"";
  out << ",\"lower_limit\":";
  write_number(out, value.lower_limit());
  out << ",\"upper_limit\":";
  write_number(out, value.upper_limit());
  out << ",\"conserve_mean\":" << (value.conserves_mean() ? "true" : "false");
  if (value.seed().has_value()) {
    out << ",\"seed\":" << *value.seed();
  }
  out << "}";
  return out.str();
}

std::string to_json(const Result& result) {
  std::ostringstream out;
  out.precision(std::numeric_limits<double>::max_digits10);
  out << "{"
      << "\"mean\":" << result.mean << ","
      << "\"lower_bound\":" << result.lower_bound << ","
      << "\"upper_bound\":" << result.upper_bound << ","
      << "\"coverage\":" << result.coverage << ","
      << "\"mode\":" << result.mode << ","
      << "\"median\":" << result.median << ","
      << "\"standard_deviation\":" << result.standard_deviation << ","
      << "\"invalid_fraction\":" << result.invalid_fraction << ","
      << "\"valid_count\":" << result.valid_count << ","
      << "\"trial_count\":" << result.trial_count << "}";
  return out.str();
}

UncertainValue value_from_json(std::string_view json) {
  JsonCursor cursor(json);
  const auto fields = cursor.parse_object();
  if (!cursor.at_end()) {
    cursor.fail("trailing characters");
  }
  return value_from_fields(fields);
}

std::string values_to_json(const std::vector<UncertainValue>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += to_json(values[i]);
  }
  out += "]";
  return out;
}

std::vector<UncertainValue> values_from_json(std::string_view json) {
  JsonCursor cursor(json);
  std::vector<UncertainValue> values;
  cursor.expect('[');
  if (!cursor.consume(']')) {
    do {
      values.push_back(value_from_fields(cursor.parse_object()));
    } while (cursor.consume(','));
    cursor.expect(']');
  }
  if (!cursor.at_end()) {
    cursor.fail("trailing characters");
  }
  return values;
}

}  // namespace asymunc
