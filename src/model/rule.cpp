#include "model/rule.hpp"

#include <stdexcept>

namespace automation_engine {

const Module *Rule::find_module(const std::string &module_id) const {
  for (const auto *modules : {&triggers, &conditions, &actions}) {
    for (const auto &m : *modules) {
      if (m.id == module_id) {
        return &m;
      }
    }
  }
  return nullptr;
}

static void validate_modules(const Rule &rule,
                             const std::vector<Module> &modules,
                             ModuleKind expected_kind,
                             std::set<std::string> &seen_ids) {
  for (std::size_t i = 0; i < modules.size(); ++i) {
    const auto &m = modules[i];
    const std::string where = "rule '" + rule.id + "' " +
                              to_string(expected_kind) + "s[" +
                              std::to_string(i) + "]";

    if (m.id.empty()) {
      throw std::invalid_argument(where + ": module id must not be empty");
    }
    if (m.kind != expected_kind) {
      throw std::invalid_argument(where + ": module '" + m.id +
                                  "' is declared as " + to_string(m.kind));
    }
    if (!seen_ids.insert(m.id).second) {
      throw std::invalid_argument(where + ": duplicate module id '" + m.id +
                                  "'");
    }
    if (m.type_uid.empty()) {
      throw std::invalid_argument(where + ": module '" + m.id +
                                  "' has no type");
    }
    // Throws for identifiers such as ":Custom"
    system_module_type(m.type_uid);
  }
}

void validate_rule(const Rule &rule) {
  if (rule.id.empty()) {
    throw std::invalid_argument("Rule id must not be empty");
  }

  std::set<std::string> seen_ids;
  validate_modules(rule, rule.triggers, ModuleKind::Trigger, seen_ids);
  validate_modules(rule, rule.conditions, ModuleKind::Condition, seen_ids);
  validate_modules(rule, rule.actions, ModuleKind::Action, seen_ids);
}

const char *to_string(RuleErrorCode code) {
  switch (code) {
  case RuleErrorCode::MissingHandler:
    return "MISSING_HANDLER";
  case RuleErrorCode::InvalidConnection:
    return "INVALID_CONNECTION";
  }
  return "UNKNOWN";
}

bool operator==(const RuleError &a, const RuleError &b) {
  return a.code == b.code && a.message == b.message;
}

bool operator==(const RuleStatus &a, const RuleStatus &b) {
  return a.initialized == b.initialized && a.enabled == b.enabled &&
         a.running == b.running && a.errors == b.errors;
}

bool operator!=(const RuleStatus &a, const RuleStatus &b) { return !(a == b); }

} // namespace automation_engine
