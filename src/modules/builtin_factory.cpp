#include "modules/builtin_factory.hpp"

#include <memory>

#include "modules/compare_condition.hpp"
#include "modules/log_action.hpp"
#include "modules/scale_action.hpp"

namespace builtin_modules {

using automation_engine::Module;
using automation_engine::system_module_type;

BuiltinHandlerFactory::BuiltinHandlerFactory(std::ostream &log_out)
    : log_out_(log_out) {}

std::set<std::string> BuiltinHandlerFactory::supported_types() const {
  return {kManualTrigger, kCompareCondition, kLogAction, kScaleAction};
}

automation_engine::TriggerHandler *
BuiltinHandlerFactory::create_trigger(const Module &module) {
  if (system_module_type(module.type_uid) != kManualTrigger) {
    return nullptr;
  }

  auto *handler = adopt(std::make_unique<ManualTriggerHandler>(module));
  std::lock_guard<std::mutex> lock(channels_mutex_);
  triggers_by_channel_.emplace(handler->channel(), handler);
  return handler;
}

automation_engine::ConditionHandler *
BuiltinHandlerFactory::create_condition(const Module &module) {
  if (system_module_type(module.type_uid) != kCompareCondition) {
    return nullptr;
  }
  return adopt(std::make_unique<CompareConditionHandler>(module));
}

automation_engine::ActionHandler *
BuiltinHandlerFactory::create_action(const Module &module) {
  std::string type = system_module_type(module.type_uid);
  if (type == kLogAction) {
    return adopt(std::make_unique<LogActionHandler>(module, log_out_));
  }
  if (type == kScaleAction) {
    return adopt(std::make_unique<ScaleActionHandler>(module));
  }
  return nullptr;
}

std::size_t
BuiltinHandlerFactory::fire(const std::string &channel,
                            const automation_engine::ValueMap &outputs) {
  // Held while firing so that release() cannot destroy a trigger in use
  std::lock_guard<std::mutex> lock(channels_mutex_);

  std::size_t fired = 0;
  auto range = triggers_by_channel_.equal_range(channel);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second->fire(outputs)) {
      ++fired;
    }
  }
  return fired;
}

std::vector<std::string> BuiltinHandlerFactory::channels() const {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  std::vector<std::string> result;
  for (const auto &[channel, handler] : triggers_by_channel_) {
    if (result.empty() || result.back() != channel) {
      result.push_back(channel);
    }
  }
  return result;
}

void BuiltinHandlerFactory::on_release(
    automation_engine::ModuleHandler *handler) {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  for (auto it = triggers_by_channel_.begin();
       it != triggers_by_channel_.end();) {
    if (it->second == handler) {
      it = triggers_by_channel_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace builtin_modules
