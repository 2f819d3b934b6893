#include "model/module.hpp"

#include <stdexcept>
#include <utility>

namespace automation_engine {

const char *to_string(ModuleKind kind) {
  switch (kind) {
  case ModuleKind::Trigger:
    return "trigger";
  case ModuleKind::Condition:
    return "condition";
  case ModuleKind::Action:
    return "action";
  }
  return "unknown";
}

bool operator==(const Connection &a, const Connection &b) {
  return a.input_name == b.input_name &&
         a.source_module_id == b.source_module_id &&
         a.source_output_name == b.source_output_name;
}

std::optional<Connection> parse_connection(const std::string &input_name,
                                           const std::string &reference) {
  const auto dot = reference.find('.');
  if (input_name.empty() || dot == std::string::npos || dot == 0 ||
      dot + 1 >= reference.size()) {
    return std::nullopt;
  }

  Connection connection;
  connection.input_name = input_name;
  connection.source_module_id = reference.substr(0, dot);
  connection.source_output_name = reference.substr(dot + 1);
  return connection;
}

std::string format_reference(const Connection &connection) {
  return connection.source_module_id + "." + connection.source_output_name;
}

Module make_trigger(const std::string &id, const std::string &type_uid,
                    ValueMap config) {
  Module m;
  m.id = id;
  m.kind = ModuleKind::Trigger;
  m.type_uid = type_uid;
  m.config = std::move(config);
  return m;
}

Module make_condition(const std::string &id, const std::string &type_uid,
                      std::vector<Connection> connections, ValueMap config) {
  Module m;
  m.id = id;
  m.kind = ModuleKind::Condition;
  m.type_uid = type_uid;
  m.config = std::move(config);
  m.connections = std::move(connections);
  return m;
}

Module make_action(const std::string &id, const std::string &type_uid,
                   std::vector<Connection> connections, ValueMap config) {
  Module m;
  m.id = id;
  m.kind = ModuleKind::Action;
  m.type_uid = type_uid;
  m.config = std::move(config);
  m.connections = std::move(connections);
  return m;
}

std::string system_module_type(const std::string &type_uid) {
  const auto idx = type_uid.find(kModuleTypeSeparator);
  std::string system_type =
      idx == std::string::npos ? type_uid : type_uid.substr(0, idx);
  if (system_type.empty()) {
    throw std::invalid_argument("Invalid module type id '" + type_uid +
                                "': system type must not be empty");
  }
  return system_type;
}

} // namespace automation_engine
