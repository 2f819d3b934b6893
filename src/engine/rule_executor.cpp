#include "engine/rule_executor.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

#include "engine/connection_resolver.hpp"

namespace automation_engine {

const char *to_string(FiringResult result) {
  switch (result) {
  case FiringResult::Dropped:
    return "dropped";
  case FiringResult::ConditionsNotMet:
    return "conditions_not_met";
  case FiringResult::Executed:
    return "executed";
  case FiringResult::Failed:
    return "failed";
  }
  return "unknown";
}

namespace {

// Clears the running flag however the firing ends
class RunningScope {
public:
  RunningScope(RuleStatusTracker &tracker, const std::string &rule_id)
      : tracker_(tracker), rule_id_(rule_id) {
    tracker_.set_running(rule_id_, true);
  }
  ~RunningScope() { tracker_.set_running(rule_id_, false); }

  RunningScope(const RunningScope &) = delete;
  RunningScope &operator=(const RunningScope &) = delete;

private:
  RuleStatusTracker &tracker_;
  const std::string &rule_id_;
};

} // namespace

ExecutionRecord RuleExecutor::run(RuleRuntime &runtime,
                                  const std::string &trigger_module_id,
                                  const ValueMap &outputs) {
  ExecutionRecord record;
  record.trigger_module_id = trigger_module_id;

  auto status = tracker_.get(runtime.id());
  if (!status || !status->enabled) {
    // Disabled rules ignore their triggers
    return record;
  }

  BoundModule *trigger = runtime.find_trigger(trigger_module_id);
  if (!trigger) {
    std::cerr << "[RuleExecutor] Rule '" << runtime.id()
              << "': firing from unknown trigger '" << trigger_module_id
              << "' dropped" << std::endl;
    return record;
  }

  RunningScope running(tracker_, runtime.id());
  std::string current_module;

  try {
    trigger->outputs = outputs;

    if (!conditions_satisfied(runtime, current_module)) {
      record.result = FiringResult::ConditionsNotMet;
      return record;
    }

    execute_actions(runtime, current_module);
    record.result = FiringResult::Executed;
  } catch (const std::exception &e) {
    record.result = FiringResult::Failed;
    record.failed_module_id = current_module;
    record.error_message = e.what();
    std::cerr << "[RuleExecutor] Rule '" << runtime.id() << "' failed in '"
              << current_module << "': " << e.what() << std::endl;
  } catch (...) {
    record.result = FiringResult::Failed;
    record.failed_module_id = current_module;
    record.error_message = "unknown exception";
    std::cerr << "[RuleExecutor] Rule '" << runtime.id() << "' failed in '"
              << current_module << "': unknown exception" << std::endl;
  }

  return record;
}

bool RuleExecutor::conditions_satisfied(RuleRuntime &runtime,
                                        std::string &current_module) {
  for (auto &condition : runtime.conditions) {
    current_module = condition.module->id;
    if (!condition.condition_handler) {
      throw std::runtime_error("condition has no handler");
    }

    const auto &connections = resolve_connections(runtime, condition);
    if (!condition.condition_handler->is_satisfied(
            collect_inputs(connections))) {
      return false;
    }
  }
  return true;
}

void RuleExecutor::execute_actions(RuleRuntime &runtime,
                                   std::string &current_module) {
  for (auto &action : runtime.actions) {
    current_module = action.module->id;
    if (!action.action_handler) {
      throw std::runtime_error("action has no handler");
    }

    const auto &connections = resolve_connections(runtime, action);
    action.outputs = action.action_handler->execute(collect_inputs(connections));
  }
}

} // namespace automation_engine
