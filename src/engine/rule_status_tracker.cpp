#include "engine/rule_status_tracker.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace automation_engine {

bool RuleStatusTracker::update(const std::string &rule_id,
                               const std::function<void(RuleStatus &)> &fn) {
  StatusListener listener;
  RuleStatus next;
  {
    std::lock_guard<std::mutex> lock(tracker_mutex_);
    auto it = statuses_.find(rule_id);
    if (it == statuses_.end()) {
      return false;
    }

    next = it->second;
    fn(next);
    if (next == it->second) {
      return true;
    }
    it->second = next;
    listener = listener_;
  }

  notify(listener, rule_id, next);
  return true;
}

void RuleStatusTracker::ensure(const std::string &rule_id, bool enabled) {
  StatusListener listener;
  RuleStatus status;
  status.enabled = enabled;
  {
    std::lock_guard<std::mutex> lock(tracker_mutex_);
    if (!statuses_.emplace(rule_id, status).second) {
      return;
    }
    listener = listener_;
  }

  notify(listener, rule_id, status);
}

void RuleStatusTracker::mark_initialized(const std::string &rule_id,
                                         std::vector<RuleError> warnings) {
  update(rule_id, [&warnings](RuleStatus &status) {
    status.initialized = true;
    status.running = false;
    status.errors = std::move(warnings);
  });
}

void RuleStatusTracker::mark_uninitialized(const std::string &rule_id,
                                           std::vector<RuleError> errors) {
  update(rule_id, [&errors](RuleStatus &status) {
    status.initialized = false;
    status.running = false;
    status.errors = std::move(errors);
  });
}

bool RuleStatusTracker::set_enabled(const std::string &rule_id,
                                    bool enabled) {
  return update(rule_id,
                [enabled](RuleStatus &status) { status.enabled = enabled; });
}

void RuleStatusTracker::set_running(const std::string &rule_id,
                                    bool running) {
  update(rule_id,
         [running](RuleStatus &status) { status.running = running; });
}

std::optional<RuleStatus>
RuleStatusTracker::get(const std::string &rule_id) const {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  auto it = statuses_.find(rule_id);
  if (it == statuses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t RuleStatusTracker::size() const {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  return statuses_.size();
}

void RuleStatusTracker::remove(const std::string &rule_id) {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  statuses_.erase(rule_id);
  remove_dependencies_locked(rule_id);
}

void RuleStatusTracker::clear() {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  statuses_.clear();
  type_to_rules_.clear();
}

void RuleStatusTracker::add_dependency(const std::string &system_type,
                                       const std::string &rule_id) {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  type_to_rules_[system_type].insert(rule_id);
}

void RuleStatusTracker::remove_dependencies(const std::string &rule_id) {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  remove_dependencies_locked(rule_id);
}

void RuleStatusTracker::remove_dependencies_locked(
    const std::string &rule_id) {
  for (auto it = type_to_rules_.begin(); it != type_to_rules_.end();) {
    it->second.erase(rule_id);
    if (it->second.empty()) {
      it = type_to_rules_.erase(it);
    } else {
      ++it;
    }
  }
}

std::set<std::string>
RuleStatusTracker::rules_for_type(const std::string &system_type) const {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  auto it = type_to_rules_.find(system_type);
  if (it == type_to_rules_.end()) {
    return {};
  }
  return it->second;
}

void RuleStatusTracker::notify(const StatusListener &listener,
                               const std::string &rule_id,
                               const RuleStatus &status) const {
  if (!listener) {
    return;
  }
  try {
    listener(rule_id, status);
  } catch (const std::exception &e) {
    std::cerr << "[RuleStatusTracker] Status listener failed for rule '"
              << rule_id << "': " << e.what() << std::endl;
  } catch (...) {
    std::cerr << "[RuleStatusTracker] Status listener failed for rule '"
              << rule_id << "': unknown exception" << std::endl;
  }
}

void RuleStatusTracker::set_listener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(tracker_mutex_);
  listener_ = std::move(listener);
}

} // namespace automation_engine
