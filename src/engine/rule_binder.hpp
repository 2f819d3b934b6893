#pragma once

#include <set>
#include <string>
#include <vector>

#include "engine/handler_registry.hpp"
#include "engine/rule_executor.hpp"
#include "engine/rule_runtime.hpp"
#include "engine/rule_status_tracker.hpp"

namespace automation_engine {

/**
 * @brief Links the modules of a rule to handlers from the registry.
 *
 * Modules are resolved conditions first, then actions, then triggers, so a
 * trigger is never wired on a rule that cannot execute. Every missing system
 * type is reported in one pass (one MissingHandler error per type).
 *
 * Called by RuleEngine under its engine mutex.
 */
class RuleBinder {
public:
  RuleBinder(HandlerRegistry &registry, RuleStatusTracker &tracker,
             RuleExecutor &executor);

  // Resolve every module. On success the rule is initialized and its
  // triggers are wired to the rule callback; on failure handlers created in
  // this pass are released and the errors land on the status. An already
  // bound rule is left as is and only its status is refreshed.
  bool bind(RuleRuntime &runtime);

  // Detach the triggers, wait for an in-flight firing and hand every handler
  // back to its factory. The status is left to the caller.
  void unbind(RuleRuntime &runtime);

  // Missing-handler error for a type that disappeared from the registry
  static RuleError missing_handler_error(const std::string &system_type);

private:
  void create_handlers(RuleRuntime &runtime, std::vector<BoundModule> &modules,
                       std::set<std::string> &missing_types,
                       std::vector<RuleError> &errors);
  static void release_handlers(std::vector<BoundModule> &modules);

  HandlerRegistry &registry_;
  RuleStatusTracker &tracker_;
  RuleExecutor &executor_;
};

} // namespace automation_engine
