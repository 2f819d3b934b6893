#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/value.hpp"

namespace automation_engine {

// Separator between a system module type and a custom sub-type, e.g.
// "core.CompareCondition:HighTemperature".
constexpr char kModuleTypeSeparator = ':';

enum class ModuleKind { Trigger, Condition, Action };

const char *to_string(ModuleKind kind);

// Static wiring of one module input to another module's output within the
// same rule.
struct Connection {
  std::string input_name;
  std::string source_module_id;
  std::string source_output_name;
};

bool operator==(const Connection &a, const Connection &b);

// Parse a "module_id.output_name" reference. Returns nullopt if either part
// is empty or the separator is missing.
std::optional<Connection> parse_connection(const std::string &input_name,
                                           const std::string &reference);

// Inverse of parse_connection: "module_id.output_name".
std::string format_reference(const Connection &connection);

// A named, typed unit of a rule. Triggers carry no connections.
struct Module {
  std::string id;
  ModuleKind kind = ModuleKind::Trigger;
  std::string type_uid;
  std::string label;
  std::string description;
  ValueMap config;
  std::vector<Connection> connections;

  // Triggers and actions expose outputs; conditions only consume.
  bool produces_outputs() const { return kind != ModuleKind::Condition; }
};

Module make_trigger(const std::string &id, const std::string &type_uid,
                    ValueMap config = {});
Module make_condition(const std::string &id, const std::string &type_uid,
                      std::vector<Connection> connections,
                      ValueMap config = {});
Module make_action(const std::string &id, const std::string &type_uid,
                   std::vector<Connection> connections, ValueMap config = {});

// System part of a module type identifier (everything before the first
// separator). Throws std::invalid_argument if the result is empty.
std::string system_module_type(const std::string &type_uid);

} // namespace automation_engine
