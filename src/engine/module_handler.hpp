#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "model/module.hpp"
#include "model/value.hpp"

namespace automation_engine {

/**
 * @brief Per-rule entry point handed to trigger handlers.
 *
 * A trigger handler calls triggered() whenever it decides to fire. The call
 * runs the rule synchronously on the caller's thread; firings of the same
 * rule are serialized.
 */
class RuleEngineCallback {
public:
  virtual ~RuleEngineCallback() = default;

  virtual void triggered(const std::string &trigger_module_id,
                         const ValueMap &outputs) = 0;
};

// Common base of every handler. Handlers are created and destroyed by their
// factory; the engine only borrows them.
class ModuleHandler {
public:
  virtual ~ModuleHandler() = default;
};

class TriggerHandler : public ModuleHandler {
public:
  // Attach (non-null) or detach (null) the rule callback. A handler should
  // stop firing the previous callback once detached; late calls are dropped
  // by the callback itself.
  virtual void set_callback(std::shared_ptr<RuleEngineCallback> callback) = 0;
};

class ConditionHandler : public ModuleHandler {
public:
  virtual bool is_satisfied(const ValueMap &inputs) = 0;
};

class ActionHandler : public ModuleHandler {
public:
  // Returned values become the action's outputs (may be empty).
  virtual ValueMap execute(const ValueMap &inputs) = 0;
};

/**
 * @brief Capability provider producing handlers for a set of system module
 * types.
 *
 * The engine dispatches on the module kind and calls the matching create_*
 * method. A factory may return nullptr when it cannot serve a module; the
 * binder treats that as a missing handler. Every handler returned is given
 * back through release() when its rule is unbound.
 */
class HandlerFactory {
public:
  virtual ~HandlerFactory() = default;

  virtual std::set<std::string> supported_types() const = 0;

  virtual TriggerHandler *create_trigger(const Module &module) = 0;
  virtual ConditionHandler *create_condition(const Module &module) = 0;
  virtual ActionHandler *create_action(const Module &module) = 0;

  virtual void release(ModuleHandler *handler) = 0;
};

/**
 * @brief HandlerFactory base that owns every handler it hands out.
 *
 * Subclasses build handlers with std::make_unique and pass them to adopt(),
 * which keeps ownership until release() or factory destruction.
 * Thread-safe.
 */
class OwningHandlerFactory : public HandlerFactory {
public:
  OwningHandlerFactory() = default;
  ~OwningHandlerFactory() override = default;

  OwningHandlerFactory(const OwningHandlerFactory &) = delete;
  OwningHandlerFactory &operator=(const OwningHandlerFactory &) = delete;

  TriggerHandler *create_trigger(const Module &) override { return nullptr; }
  ConditionHandler *create_condition(const Module &) override {
    return nullptr;
  }
  ActionHandler *create_action(const Module &) override { return nullptr; }

  void release(ModuleHandler *handler) override;

  // Number of handlers created and not yet released
  std::size_t live_handler_count() const;

protected:
  template <typename T> T *adopt(std::unique_ptr<T> handler) {
    T *raw = handler.get();
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[raw] = std::move(handler);
    return raw;
  }

  // Hook for subclasses that index their handlers; called before the handler
  // is destroyed.
  virtual void on_release(ModuleHandler * /*handler*/) {}

private:
  std::map<const ModuleHandler *, std::unique_ptr<ModuleHandler>> handlers_;
  mutable std::mutex handlers_mutex_;
};

} // namespace automation_engine
