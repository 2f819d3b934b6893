#include "modules/manual_trigger.hpp"

#include <utility>

namespace builtin_modules {

ManualTriggerHandler::ManualTriggerHandler(
    const automation_engine::Module &module)
    : module_id_(module.id),
      channel_(automation_engine::string_at(module.config, "channel")
                   .value_or(module.id)) {}

void ManualTriggerHandler::set_callback(
    std::shared_ptr<automation_engine::RuleEngineCallback> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

bool ManualTriggerHandler::fire(const automation_engine::ValueMap &outputs) {
  std::shared_ptr<automation_engine::RuleEngineCallback> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = callback_;
  }
  if (!callback) {
    return false;
  }

  // Called outside the lock: the rule run may detach this trigger
  callback->triggered(module_id_, outputs);
  return true;
}

} // namespace builtin_modules
