#include "model/value.hpp"

#include <sstream>

namespace automation_engine {

Value make_bool(bool v) {
  Value val;
  val.set_type(automation::v1::VALUE_TYPE_BOOL);
  val.set_bool_value(v);
  return val;
}

Value make_int64(int64_t v) {
  Value val;
  val.set_type(automation::v1::VALUE_TYPE_INT64);
  val.set_int64_value(v);
  return val;
}

Value make_double(double v) {
  Value val;
  val.set_type(automation::v1::VALUE_TYPE_DOUBLE);
  val.set_double_value(v);
  return val;
}

Value make_string(const std::string &v) {
  Value val;
  val.set_type(automation::v1::VALUE_TYPE_STRING);
  val.set_string_value(v);
  return val;
}

std::optional<double> as_number(const Value &v) {
  switch (v.type()) {
  case automation::v1::VALUE_TYPE_INT64:
    return static_cast<double>(v.int64_value());
  case automation::v1::VALUE_TYPE_DOUBLE:
    return v.double_value();
  default:
    return std::nullopt;
  }
}

std::optional<bool> as_bool(const Value &v) {
  if (v.type() != automation::v1::VALUE_TYPE_BOOL) {
    return std::nullopt;
  }
  return v.bool_value();
}

std::optional<std::string> as_string(const Value &v) {
  if (v.type() != automation::v1::VALUE_TYPE_STRING) {
    return std::nullopt;
  }
  return v.string_value();
}

std::optional<double> number_at(const ValueMap &values,
                                const std::string &key) {
  auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return as_number(it->second);
}

std::optional<std::string> string_at(const ValueMap &values,
                                     const std::string &key) {
  auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return as_string(it->second);
}

std::optional<bool> bool_at(const ValueMap &values, const std::string &key) {
  auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return as_bool(it->second);
}

bool values_equal(const Value &a, const Value &b) {
  auto na = as_number(a);
  auto nb = as_number(b);
  if (na && nb) {
    return *na == *nb;
  }
  if (a.type() != b.type()) {
    return false;
  }

  switch (a.type()) {
  case automation::v1::VALUE_TYPE_BOOL:
    return a.bool_value() == b.bool_value();
  case automation::v1::VALUE_TYPE_STRING:
    return a.string_value() == b.string_value();
  default:
    return true;
  }
}

bool value_maps_equal(const ValueMap &a, const ValueMap &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto &[key, value] : a) {
    auto it = b.find(key);
    if (it == b.end() || !values_equal(value, it->second)) {
      return false;
    }
  }
  return true;
}

std::string to_display_string(const Value &v) {
  switch (v.type()) {
  case automation::v1::VALUE_TYPE_BOOL:
    return v.bool_value() ? "true" : "false";
  case automation::v1::VALUE_TYPE_INT64:
    return std::to_string(v.int64_value());
  case automation::v1::VALUE_TYPE_DOUBLE: {
    std::ostringstream out;
    out << v.double_value();
    return out.str();
  }
  case automation::v1::VALUE_TYPE_STRING:
    return v.string_value();
  default:
    return "<unset>";
  }
}

std::string to_display_string(const ValueMap &values) {
  std::ostringstream out;
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out << " ";
    }
    first = false;
    out << key << "=" << to_display_string(value);
  }
  return out.str();
}

} // namespace automation_engine
