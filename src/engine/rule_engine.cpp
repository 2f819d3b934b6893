#include "engine/rule_engine.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "engine/rule_callback.hpp"

namespace automation_engine {

RuleEngine::RuleEngine()
    : executor_(tracker_), binder_(registry_, tracker_, executor_) {}

RuleEngine::~RuleEngine() { dispose(); }

// -----------------------------
// Handler factories
// -----------------------------

void RuleEngine::register_factory(std::shared_ptr<HandlerFactory> factory) {
  if (!factory) {
    return;
  }
  post_factory_event({FactoryEventType::Added, std::move(factory)});
}

void RuleEngine::unregister_factory(
    const std::shared_ptr<HandlerFactory> &factory) {
  if (!factory) {
    return;
  }
  post_factory_event({FactoryEventType::Removed, factory});
}

RuleEngine::MutationLock::MutationLock(RuleEngine &engine)
    : engine_(engine), lock_(engine.engine_mutex_) {
  std::lock_guard<std::mutex> events_lock(engine_.events_mutex_);
  engine_.lock_owner_ = std::this_thread::get_id();
}

RuleEngine::MutationLock::~MutationLock() {
  engine_.drain_factory_events();
  std::lock_guard<std::mutex> events_lock(engine_.events_mutex_);
  engine_.lock_owner_ = std::thread::id();
}

void RuleEngine::post_factory_event(FactoryEvent event) {
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    pending_events_.push_back(std::move(event));
    if (lock_owner_ == std::this_thread::get_id()) {
      // Re-entrant post; drained when the owning operation completes
      return;
    }
  }

  MutationLock lock(*this);
}

void RuleEngine::drain_factory_events() {
  while (true) {
    FactoryEvent event;
    {
      std::lock_guard<std::mutex> lock(events_mutex_);
      if (pending_events_.empty()) {
        return;
      }
      event = std::move(pending_events_.front());
      pending_events_.pop_front();
    }

    try {
      if (event.type == FactoryEventType::Added) {
        on_factory_added(event.factory);
      } else {
        on_factory_removed(event.factory);
      }
    } catch (const std::exception &e) {
      std::cerr << "[RuleEngine] Failed to process handler factory event: "
                << e.what() << std::endl;
    }
  }
}

void RuleEngine::on_factory_added(
    const std::shared_ptr<HandlerFactory> &factory) {
  const auto types = registry_.add(factory);
  if (types.empty()) {
    return;
  }

  std::set<std::string> pending_rules;
  for (const auto &type : types) {
    for (const auto &rule_id : tracker_.rules_for_type(type)) {
      auto status = tracker_.get(rule_id);
      if (!status || !status->initialized) {
        pending_rules.insert(rule_id);
      }
    }
  }

  std::cerr << "[RuleEngine] Handler factory added (" << types.size()
            << " types); re-binding " << pending_rules.size() << " rules"
            << std::endl;

  for (const auto &rule_id : pending_rules) {
    auto it = rules_.find(rule_id);
    if (it != rules_.end()) {
      binder_.bind(*it->second);
    }
  }
}

void RuleEngine::on_factory_removed(
    const std::shared_ptr<HandlerFactory> &factory) {
  const auto removed = registry_.remove(factory);
  const std::set<std::string> removed_types(removed.begin(), removed.end());

  for (auto &[rule_id, runtime] : rules_) {
    if (!runtime->bound) {
      continue;
    }

    std::vector<RuleError> errors;
    std::set<std::string> missing;
    bool uses_factory = false;
    for (const auto *slots :
         {&runtime->conditions, &runtime->actions, &runtime->triggers}) {
      for (const auto &slot : *slots) {
        const auto type = system_module_type(slot.module->type_uid);
        if (removed_types.count(type) && missing.insert(type).second) {
          errors.push_back(RuleBinder::missing_handler_error(type));
        }
        if (slot.factory == factory) {
          uses_factory = true;
        }
      }
    }

    if (!errors.empty()) {
      binder_.unbind(*runtime);
      tracker_.mark_uninitialized(rule_id, std::move(errors));
      std::cerr << "[RuleEngine] Rule '" << rule_id
                << "' stopped: handler factory removed" << std::endl;
    } else if (uses_factory) {
      // Handlers came from a factory shadowed by a later registration
      binder_.unbind(*runtime);
      binder_.bind(*runtime);
    }
  }
}

std::vector<std::string> RuleEngine::registered_types() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  return registry_.registered_types();
}

// -----------------------------
// Rules
// -----------------------------

void RuleEngine::set_rule(const Rule &rule) {
  validate_rule(rule);

  MutationLock lock(*this);
  if (disposed_) {
    std::cerr << "[RuleEngine] Engine disposed; rule '" << rule.id
              << "' ignored" << std::endl;
    return;
  }

  std::shared_ptr<RuleCallback> callback;
  auto it = rules_.find(rule.id);
  if (it != rules_.end()) {
    binder_.unbind(*it->second);
    callback = it->second->callback;
    tracker_.remove_dependencies(rule.id);
  }

  tracker_.ensure(rule.id, rule.initial_enabled);

  auto runtime = std::make_unique<RuleRuntime>(rule);
  runtime->callback = std::move(callback);
  RuleRuntime &bound = *runtime;
  rules_[rule.id] = std::move(runtime);

  binder_.bind(bound);
}

std::optional<Rule> RuleEngine::remove_rule(const std::string &rule_id) {
  MutationLock lock(*this);
  auto it = rules_.find(rule_id);
  if (it == rules_.end()) {
    return std::nullopt;
  }

  RuleRuntime &runtime = *it->second;
  binder_.unbind(runtime);
  if (runtime.callback) {
    runtime.callback->dispose();
  }
  tracker_.remove(rule_id);

  Rule removed = runtime.rule;
  rules_.erase(it);

  std::cerr << "[RuleEngine] Rule '" << rule_id << "' removed" << std::endl;
  return removed;
}

std::optional<Rule> RuleEngine::get_rule(const std::string &rule_id) const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  auto it = rules_.find(rule_id);
  if (it == rules_.end()) {
    return std::nullopt;
  }
  return it->second->rule;
}

std::vector<Rule> RuleEngine::get_rules() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  std::vector<Rule> result;
  result.reserve(rules_.size());
  for (const auto &kv : rules_) {
    result.push_back(kv.second->rule);
  }
  return result;
}

std::vector<Rule> RuleEngine::get_rules_by_tag(const std::string &tag) const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  std::vector<Rule> result;
  for (const auto &kv : rules_) {
    if (kv.second->rule.tags.count(tag)) {
      result.push_back(kv.second->rule);
    }
  }
  return result;
}

std::vector<Rule>
RuleEngine::get_rules_by_tags(const std::set<std::string> &tags) const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  std::vector<Rule> result;
  for (const auto &kv : rules_) {
    for (const auto &tag : kv.second->rule.tags) {
      if (tags.count(tag)) {
        result.push_back(kv.second->rule);
        break;
      }
    }
  }
  return result;
}

std::set<std::string> RuleEngine::get_scope_ids() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  std::set<std::string> scopes;
  for (const auto &kv : rules_) {
    if (!kv.second->rule.scope.empty()) {
      scopes.insert(kv.second->rule.scope);
    }
  }
  return scopes;
}

// -----------------------------
// Status
// -----------------------------

bool RuleEngine::set_enabled(const std::string &rule_id, bool enabled) {
  return tracker_.set_enabled(rule_id, enabled);
}

std::optional<RuleStatus>
RuleEngine::get_status(const std::string &rule_id) const {
  return tracker_.get(rule_id);
}

bool RuleEngine::is_running(const std::string &rule_id) const {
  auto status = tracker_.get(rule_id);
  return status && status->running;
}

std::optional<ExecutionRecord>
RuleEngine::last_execution(const std::string &rule_id) const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  auto it = rules_.find(rule_id);
  if (it == rules_.end() || !it->second->callback) {
    return std::nullopt;
  }
  return it->second->callback->last_execution();
}

void RuleEngine::set_status_listener(StatusListener listener) {
  tracker_.set_listener(std::move(listener));
}

// -----------------------------
// Introspection / teardown
// -----------------------------

std::set<std::string>
RuleEngine::rules_depending_on(const std::string &module_type) const {
  return tracker_.rules_for_type(system_module_type(module_type));
}

bool RuleEngine::has_callback(const std::string &rule_id) const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  auto it = rules_.find(rule_id);
  return it != rules_.end() && it->second->callback != nullptr;
}

void RuleEngine::dispose() {
  MutationLock lock(*this);
  if (disposed_) {
    return;
  }
  disposed_ = true;

  registry_.close();
  for (auto &kv : rules_) {
    binder_.unbind(*kv.second);
    if (kv.second->callback) {
      kv.second->callback->dispose();
    }
  }
  const auto rule_count = rules_.size();
  rules_.clear();
  tracker_.clear();

  std::cerr << "[RuleEngine] Disposed (" << rule_count << " rules released)"
            << std::endl;
}

bool RuleEngine::is_disposed() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  return disposed_;
}

} // namespace automation_engine
