#include "engine/connection_resolver.hpp"

#include <iostream>

namespace automation_engine {

// Empty string when the connection is usable, otherwise the reason.
static std::string check_source(const Rule &rule, const Module &target,
                                const Connection &connection) {
  if (connection.source_module_id == target.id) {
    return "module cannot be connected to itself";
  }
  const Module *source = rule.find_module(connection.source_module_id);
  if (!source) {
    return "source module '" + connection.source_module_id +
           "' does not exist";
  }
  if (!source->produces_outputs()) {
    return "source module '" + connection.source_module_id + "' is a " +
           to_string(source->kind) + " and has no outputs";
  }
  return "";
}

static void validate_module_connections(const Rule &rule,
                                        const std::vector<Module> &modules,
                                        std::vector<RuleError> &errors) {
  for (const auto &m : modules) {
    for (const auto &connection : m.connections) {
      const std::string reason = check_source(rule, m, connection);
      if (reason.empty()) {
        continue;
      }
      RuleError err;
      err.code = RuleErrorCode::InvalidConnection;
      err.message = "Invalid connection " + m.id + "." +
                    connection.input_name + " <- " +
                    format_reference(connection) + ": " + reason;
      errors.push_back(err);
    }
  }
}

std::vector<RuleError> validate_connections(const Rule &rule) {
  std::vector<RuleError> errors;
  validate_module_connections(rule, rule.conditions, errors);
  validate_module_connections(rule, rule.actions, errors);
  return errors;
}

const std::map<std::string, OutputRef> &
resolve_connections(RuleRuntime &runtime, BoundModule &module) {
  if (module.connections) {
    return *module.connections;
  }

  std::map<std::string, OutputRef> resolved;
  for (const auto &connection : module.module->connections) {
    const std::string reason =
        check_source(runtime.rule, *module.module, connection);
    if (!reason.empty()) {
      std::cerr << "[ConnectionResolver] Rule '" << runtime.id() << "': "
                << to_string(module.module->kind) << " '" << module.module->id
                << "' input '" << connection.input_name
                << "' not connected: " << reason << std::endl;
      continue;
    }

    BoundModule *source = runtime.find(connection.source_module_id);
    resolved.emplace(connection.input_name,
                     OutputRef(&source->outputs, connection.source_output_name));
  }

  module.connections = std::move(resolved);
  return *module.connections;
}

ValueMap collect_inputs(const std::map<std::string, OutputRef> &connections) {
  ValueMap inputs;
  for (const auto &[input_name, ref] : connections) {
    auto value = ref.value();
    if (value) {
      inputs[input_name] = *value;
    }
  }
  return inputs;
}

} // namespace automation_engine
