#pragma once

#include <set>
#include <string>
#include <vector>

#include "model/module.hpp"

namespace automation_engine {

// Rule definition: ordered triggers, conditions and actions. A rule without
// triggers is valid but never fires.
struct Rule {
  std::string id;
  std::string label;
  std::string description;
  std::set<std::string> tags;
  std::string scope;
  bool initial_enabled = true;

  std::vector<Module> triggers;
  std::vector<Module> conditions;
  std::vector<Module> actions;

  // Looks up a module of any kind by id. nullptr if absent.
  const Module *find_module(const std::string &module_id) const;

  std::size_t module_count() const {
    return triggers.size() + conditions.size() + actions.size();
  }
};

// Rejects definitions the engine cannot address: empty rule or module ids,
// duplicate module ids, empty or malformed module type identifiers, and
// module kinds that do not match the list they are declared in.
// Throws std::invalid_argument.
void validate_rule(const Rule &rule);

enum class RuleErrorCode {
  MissingHandler,   // No factory (or no handler) for a module type
  InvalidConnection // Connection source missing or not output-producing
};

const char *to_string(RuleErrorCode code);

struct RuleError {
  RuleErrorCode code = RuleErrorCode::MissingHandler;
  std::string message;
};

bool operator==(const RuleError &a, const RuleError &b);

// Snapshot of a rule's state. Replaced as a whole on every transition.
struct RuleStatus {
  bool initialized = false;
  bool enabled = false;
  bool running = false;
  std::vector<RuleError> errors;
};

bool operator==(const RuleStatus &a, const RuleStatus &b);
bool operator!=(const RuleStatus &a, const RuleStatus &b);

} // namespace automation_engine
