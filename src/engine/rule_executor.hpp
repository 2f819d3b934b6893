#pragma once

#include <cstdint>
#include <string>

#include "engine/rule_runtime.hpp"
#include "engine/rule_status_tracker.hpp"

namespace automation_engine {

enum class FiringResult {
  Dropped,          // Rule unknown/disabled, or trigger not part of the rule
  ConditionsNotMet, // A condition returned false
  Executed,         // Every action ran
  Failed            // A condition or action handler threw
};

const char *to_string(FiringResult result);

// Outcome of one trigger firing.
struct ExecutionRecord {
  std::string trigger_module_id;
  FiringResult result = FiringResult::Dropped;
  std::string failed_module_id;
  std::string error_message;
  uint64_t firing_count = 0;
};

/**
 * @brief Runs a rule for one trigger firing.
 *
 * Conditions are evaluated in declaration order (all must hold, first false
 * stops); actions then run in declaration order, each action's outputs
 * becoming visible to later ones. A throwing handler aborts the firing and
 * is logged; the rule's status is left as it was.
 *
 * The caller serializes firings of the same rule.
 */
class RuleExecutor {
public:
  explicit RuleExecutor(RuleStatusTracker &tracker) : tracker_(tracker) {}

  ExecutionRecord run(RuleRuntime &runtime,
                      const std::string &trigger_module_id,
                      const ValueMap &outputs);

private:
  bool conditions_satisfied(RuleRuntime &runtime, std::string &current_module);
  void execute_actions(RuleRuntime &runtime, std::string &current_module);

  RuleStatusTracker &tracker_;
};

} // namespace automation_engine
