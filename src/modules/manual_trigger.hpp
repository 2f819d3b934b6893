#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "engine/module_handler.hpp"

namespace builtin_modules {

// Trigger fired on demand through its channel (config "channel", defaults
// to the module id).
class ManualTriggerHandler : public automation_engine::TriggerHandler {
public:
  explicit ManualTriggerHandler(const automation_engine::Module &module);

  void set_callback(
      std::shared_ptr<automation_engine::RuleEngineCallback> callback) override;

  // Returns false if no callback is attached.
  bool fire(const automation_engine::ValueMap &outputs);

  const std::string &module_id() const { return module_id_; }
  const std::string &channel() const { return channel_; }

private:
  std::string module_id_;
  std::string channel_;

  std::shared_ptr<automation_engine::RuleEngineCallback> callback_;
  std::mutex callback_mutex_;
};

} // namespace builtin_modules
