#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "model/rule.hpp"

namespace automation_engine {

using StatusListener =
    std::function<void(const std::string &rule_id, const RuleStatus &status)>;

/**
 * @brief Per-rule status table plus the module type -> rules reverse index.
 *
 * Status transitions:
 *   ensure()             -> uninitialized (first sight of a rule)
 *   mark_initialized()   -> initialized, running cleared
 *   mark_uninitialized() -> uninitialized with errors, running cleared
 *   remove()             -> gone
 * The enabled flag survives every transition except remove().
 *
 * Every change stores a fresh RuleStatus. A replacement equal to the stored
 * status is dropped and not reported to the listener.
 *
 * Thread Safety:
 *   Internally locked. The mutex is a leaf: the listener runs after it is
 *   released, and no other lock is taken while it is held.
 *
 * A listener that throws is logged and the transition stands.
 */
class RuleStatusTracker {
public:
  RuleStatusTracker() = default;

  RuleStatusTracker(const RuleStatusTracker &) = delete;
  RuleStatusTracker &operator=(const RuleStatusTracker &) = delete;

  // Create the uninitialized status of a new rule. No-op if the rule is
  // already tracked.
  void ensure(const std::string &rule_id, bool enabled);

  // Only errors that do not block execution (connection problems) belong
  // here.
  void mark_initialized(const std::string &rule_id,
                        std::vector<RuleError> warnings);
  void mark_uninitialized(const std::string &rule_id,
                          std::vector<RuleError> errors);

  // Returns false for unknown rules; nothing is created for them.
  bool set_enabled(const std::string &rule_id, bool enabled);
  void set_running(const std::string &rule_id, bool running);

  std::optional<RuleStatus> get(const std::string &rule_id) const;
  std::size_t size() const;

  // Forget the rule's status and its reverse-index entries.
  void remove(const std::string &rule_id);
  void clear();

  // ---- Reverse index (system module type -> dependent rules) ----

  void add_dependency(const std::string &system_type,
                      const std::string &rule_id);
  void remove_dependencies(const std::string &rule_id);
  std::set<std::string> rules_for_type(const std::string &system_type) const;

  void set_listener(StatusListener listener);

private:
  // Applies fn to a copy of the rule's status and stores the result.
  // Returns false if the rule is unknown.
  bool update(const std::string &rule_id,
              const std::function<void(RuleStatus &)> &fn);

  void remove_dependencies_locked(const std::string &rule_id);

  void notify(const StatusListener &listener, const std::string &rule_id,
              const RuleStatus &status) const;

  std::map<std::string, RuleStatus> statuses_;
  std::map<std::string, std::set<std::string>> type_to_rules_;
  StatusListener listener_;

  mutable std::mutex tracker_mutex_;
};

} // namespace automation_engine
