#include "engine/rule_callback.hpp"

#include <utility>

#include "engine/rule_runtime.hpp"

namespace automation_engine {

RuleCallback::RuleCallback(std::string rule_id, RuleExecutor &executor)
    : rule_id_(std::move(rule_id)), executor_(executor) {}

void RuleCallback::triggered(const std::string &trigger_module_id,
                             const ValueMap &outputs) {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  if (!runtime_) {
    return;
  }

  ExecutionRecord record = executor_.run(*runtime_, trigger_module_id, outputs);
  record.firing_count = ++firing_count_;

  std::lock_guard<std::mutex> record_lock(record_mutex_);
  last_execution_ = std::move(record);
}

void RuleCallback::attach(RuleRuntime *runtime) {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  if (disposed_) {
    return;
  }
  runtime_ = runtime;
}

void RuleCallback::detach() {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  runtime_ = nullptr;
}

void RuleCallback::dispose() {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  runtime_ = nullptr;
  disposed_ = true;
}

bool RuleCallback::is_attached() const {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  return runtime_ != nullptr;
}

bool RuleCallback::is_disposed() const {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  return disposed_;
}

std::optional<ExecutionRecord> RuleCallback::last_execution() const {
  std::lock_guard<std::mutex> lock(record_mutex_);
  return last_execution_;
}

} // namespace automation_engine
