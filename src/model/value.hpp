#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "automation.pb.h"

namespace automation_engine {

using automation::v1::Value;
using automation::v1::ValueType;

// Named values: trigger/action outputs, condition/action inputs and module
// configuration all use this shape.
using ValueMap = std::map<std::string, Value>;

Value make_bool(bool v);
Value make_int64(int64_t v);
Value make_double(double v);
Value make_string(const std::string &v);

// Numeric view of a value. int64 and double convert; bool, string and
// unspecified values do not.
std::optional<double> as_number(const Value &v);

std::optional<bool> as_bool(const Value &v);
std::optional<std::string> as_string(const Value &v);

// Typed lookups into a ValueMap. Missing keys and type mismatches yield
// nullopt.
std::optional<double> number_at(const ValueMap &values, const std::string &key);
std::optional<std::string> string_at(const ValueMap &values,
                                     const std::string &key);
std::optional<bool> bool_at(const ValueMap &values, const std::string &key);

// Same type tag and same payload. int64 and double are compared numerically.
bool values_equal(const Value &a, const Value &b);
bool value_maps_equal(const ValueMap &a, const ValueMap &b);

// Human-readable rendering used in log lines.
std::string to_display_string(const Value &v);
std::string to_display_string(const ValueMap &values);

} // namespace automation_engine
