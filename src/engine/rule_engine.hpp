#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "engine/handler_registry.hpp"
#include "engine/module_handler.hpp"
#include "engine/rule_binder.hpp"
#include "engine/rule_executor.hpp"
#include "engine/rule_runtime.hpp"
#include "engine/rule_status_tracker.hpp"
#include "model/rule.hpp"

namespace automation_engine {

/**
 * @brief Binds rules to handlers from registered factories and runs them
 * when their triggers fire.
 *
 * A rule is kept even when some of its module types have no factory yet; it
 * stays uninitialized with one MissingHandler error per missing type and is
 * bound automatically once a factory for those types is registered. When a
 * factory goes away, the rules that used it fall back to uninitialized; their
 * enabled flag is kept.
 *
 * Thread Safety:
 *   Rule table, registry and reverse index are guarded by one engine mutex.
 *   Factory registration goes through a FIFO event queue drained under that
 *   mutex; events posted while the engine is busy on the same thread (e.g. by
 *   a factory's create_*) are handled after the current operation. Trigger firings never take the engine
 *   mutex: they serialize per rule on the rule callback and read the status
 *   tracker only.
 *
 *   The status listener and handlers run synchronously, partly while engine
 *   locks are held. From there only set_enabled(), get_status() and
 *   is_running() may be called back.
 */
class RuleEngine {
public:
  RuleEngine();
  ~RuleEngine();

  RuleEngine(const RuleEngine &) = delete;
  RuleEngine &operator=(const RuleEngine &) = delete;

  // ---- Handler factories ----

  // Registering the same factory twice is harmless. Ignored once disposed.
  void register_factory(std::shared_ptr<HandlerFactory> factory);
  void unregister_factory(const std::shared_ptr<HandlerFactory> &factory);

  std::vector<std::string> registered_types() const;

  // ---- Rules ----

  // Add or replace a rule and try to bind it. Binding problems are reported
  // through get_status(), never thrown. Throws std::invalid_argument for
  // malformed definitions (see validate_rule).
  void set_rule(const Rule &rule);

  // Unbind and forget the rule, its status and its reverse-index entries.
  std::optional<Rule> remove_rule(const std::string &rule_id);

  std::optional<Rule> get_rule(const std::string &rule_id) const;
  std::vector<Rule> get_rules() const;
  std::vector<Rule> get_rules_by_tag(const std::string &tag) const;

  // Rules carrying at least one of the tags
  std::vector<Rule> get_rules_by_tags(const std::set<std::string> &tags) const;

  // Distinct non-empty scope identifiers of all rules
  std::set<std::string> get_scope_ids() const;

  // ---- Status ----

  // Pure status change; returns false for unknown rules.
  bool set_enabled(const std::string &rule_id, bool enabled);
  std::optional<RuleStatus> get_status(const std::string &rule_id) const;
  bool is_running(const std::string &rule_id) const;

  // Outcome of the rule's most recent firing
  std::optional<ExecutionRecord>
  last_execution(const std::string &rule_id) const;

  // Called after every effective status change, outside the engine locks.
  // Exceptions thrown by the listener are logged and dropped.
  void set_status_listener(StatusListener listener);

  // ---- Introspection ----

  std::set<std::string>
  rules_depending_on(const std::string &module_type) const;
  bool has_callback(const std::string &rule_id) const;

  // Unbind and drop every rule and close the registry. Idempotent; the
  // engine accepts no rules, factories or firings afterwards.
  void dispose();
  bool is_disposed() const;

private:
  enum class FactoryEventType { Added, Removed };

  struct FactoryEvent {
    FactoryEventType type;
    std::shared_ptr<HandlerFactory> factory;
  };

  // Engine mutex holder for operations that may call into factories. Events
  // posted by the owning thread meanwhile are queued and drained before the
  // mutex is released.
  class MutationLock {
  public:
    explicit MutationLock(RuleEngine &engine);
    ~MutationLock();

    MutationLock(const MutationLock &) = delete;
    MutationLock &operator=(const MutationLock &) = delete;

  private:
    RuleEngine &engine_;
    std::lock_guard<std::mutex> lock_;
  };

  void post_factory_event(FactoryEvent event);
  void drain_factory_events();
  void on_factory_added(const std::shared_ptr<HandlerFactory> &factory);
  void on_factory_removed(const std::shared_ptr<HandlerFactory> &factory);

  HandlerRegistry registry_;
  RuleStatusTracker tracker_;
  RuleExecutor executor_;
  RuleBinder binder_;

  std::map<std::string, std::unique_ptr<RuleRuntime>> rules_;
  bool disposed_ = false;
  mutable std::mutex engine_mutex_;

  std::deque<FactoryEvent> pending_events_;
  std::thread::id lock_owner_;
  std::mutex events_mutex_;
};

} // namespace automation_engine
