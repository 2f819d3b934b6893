#pragma once

#include <cstddef>
#include <iostream>
#include <map>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "engine/module_handler.hpp"
#include "modules/manual_trigger.hpp"

namespace builtin_modules {

constexpr const char *kManualTrigger = "core.ManualTrigger";
constexpr const char *kCompareCondition = "core.CompareCondition";
constexpr const char *kLogAction = "core.LogAction";
constexpr const char *kScaleAction = "core.ScaleAction";

/**
 * @brief Factory for the module types shipped with the engine.
 *
 * Creates a handler only when the module kind matches its type, e.g. a
 * core.LogAction declared as a trigger yields nullptr. Manual triggers are
 * indexed by channel so that fire() can reach them.
 */
class BuiltinHandlerFactory : public automation_engine::OwningHandlerFactory {
public:
  explicit BuiltinHandlerFactory(std::ostream &log_out = std::cerr);

  std::set<std::string> supported_types() const override;

  automation_engine::TriggerHandler *
  create_trigger(const automation_engine::Module &module) override;
  automation_engine::ConditionHandler *
  create_condition(const automation_engine::Module &module) override;
  automation_engine::ActionHandler *
  create_action(const automation_engine::Module &module) override;

  // Fire every attached manual trigger on the channel. Returns how many
  // were fired.
  std::size_t fire(const std::string &channel,
                   const automation_engine::ValueMap &outputs);

  std::vector<std::string> channels() const;

protected:
  void on_release(automation_engine::ModuleHandler *handler) override;

private:
  std::ostream &log_out_;

  std::multimap<std::string, ManualTriggerHandler *> triggers_by_channel_;
  mutable std::mutex channels_mutex_;
};

} // namespace builtin_modules
