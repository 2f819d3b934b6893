#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "engine/module_handler.hpp"
#include "engine/rule_executor.hpp"

namespace automation_engine {

struct RuleRuntime;

/**
 * @brief The callback trigger handlers of one rule fire into.
 *
 * One instance per rule, created on its first successful bind and reused
 * across re-initializations. While attached to the rule's runtime, every
 * triggered() call runs the rule under the execution mutex, so firings of the
 * same rule never interleave. Detached or disposed, firings are dropped.
 *
 * Trigger handlers may keep their shared_ptr after the rule or the engine is
 * gone; a disposed callback never touches engine state again.
 */
class RuleCallback : public RuleEngineCallback {
public:
  RuleCallback(std::string rule_id, RuleExecutor &executor);

  void triggered(const std::string &trigger_module_id,
                 const ValueMap &outputs) override;

  void attach(RuleRuntime *runtime);

  // Blocks until an in-flight firing has finished.
  void detach();

  // Detach for good; later attach() calls are ignored.
  void dispose();

  bool is_attached() const;
  bool is_disposed() const;

  std::optional<ExecutionRecord> last_execution() const;

private:
  const std::string rule_id_;
  RuleExecutor &executor_;

  RuleRuntime *runtime_ = nullptr;
  bool disposed_ = false;
  uint64_t firing_count_ = 0;
  mutable std::mutex exec_mutex_;

  std::optional<ExecutionRecord> last_execution_;
  mutable std::mutex record_mutex_;
};

} // namespace automation_engine
