#include "engine/rule_binder.hpp"

#include <exception>
#include <iostream>
#include <memory>

#include "engine/connection_resolver.hpp"
#include "engine/rule_callback.hpp"

namespace automation_engine {

RuleBinder::RuleBinder(HandlerRegistry &registry, RuleStatusTracker &tracker,
                       RuleExecutor &executor)
    : registry_(registry), tracker_(tracker), executor_(executor) {}

RuleError RuleBinder::missing_handler_error(const std::string &system_type) {
  RuleError err;
  err.code = RuleErrorCode::MissingHandler;
  err.message = "Missing handler: " + system_type;
  return err;
}

void RuleBinder::create_handlers(RuleRuntime &runtime,
                                 std::vector<BoundModule> &modules,
                                 std::set<std::string> &missing_types,
                                 std::vector<RuleError> &errors) {
  for (auto &slot : modules) {
    const Module &m = *slot.module;
    const std::string system_type = system_module_type(m.type_uid);
    tracker_.add_dependency(system_type, runtime.id());

    auto factory = registry_.find(system_type);
    std::string failure;
    if (factory) {
      try {
        switch (m.kind) {
        case ModuleKind::Trigger:
          slot.trigger_handler = factory->create_trigger(m);
          break;
        case ModuleKind::Condition:
          slot.condition_handler = factory->create_condition(m);
          break;
        case ModuleKind::Action:
          slot.action_handler = factory->create_action(m);
          break;
        }
      } catch (const std::exception &e) {
        failure = e.what();
      } catch (...) {
        failure = "unknown exception";
      }
    }

    if (slot.is_bound()) {
      slot.factory = factory;
      continue;
    }

    if (missing_types.insert(system_type).second) {
      RuleError err;
      err.code = RuleErrorCode::MissingHandler;
      err.message = "Missing handler: " + m.type_uid + ", for module: " + m.id;
      if (!failure.empty()) {
        err.message += " (" + failure + ")";
      }
      std::cerr << "[RuleBinder] Rule '" << runtime.id()
                << "': " << err.message << std::endl;
      errors.push_back(err);
    }
  }
}

bool RuleBinder::bind(RuleRuntime &runtime) {
  if (runtime.bound) {
    tracker_.mark_initialized(runtime.id(), validate_connections(runtime.rule));
    return true;
  }

  std::set<std::string> missing_types;
  std::vector<RuleError> errors;
  create_handlers(runtime, runtime.conditions, missing_types, errors);
  create_handlers(runtime, runtime.actions, missing_types, errors);
  create_handlers(runtime, runtime.triggers, missing_types, errors);

  if (!errors.empty()) {
    unbind(runtime);
    tracker_.mark_uninitialized(runtime.id(), std::move(errors));
    return false;
  }

  if (!runtime.callback) {
    runtime.callback = std::make_shared<RuleCallback>(runtime.id(), executor_);
  }
  runtime.callback->attach(&runtime);
  runtime.bound = true;

  auto warnings = validate_connections(runtime.rule);
  for (const auto &w : warnings) {
    std::cerr << "[RuleBinder] Rule '" << runtime.id() << "': " << w.message
              << std::endl;
  }
  tracker_.mark_initialized(runtime.id(), std::move(warnings));

  for (auto &trigger : runtime.triggers) {
    trigger.trigger_handler->set_callback(runtime.callback);
  }

  std::cerr << "[RuleBinder] Rule '" << runtime.id() << "' initialized ("
            << runtime.rule.module_count() << " modules)" << std::endl;
  return true;
}

void RuleBinder::unbind(RuleRuntime &runtime) {
  for (auto &trigger : runtime.triggers) {
    if (trigger.trigger_handler) {
      trigger.trigger_handler->set_callback(nullptr);
    }
  }

  if (runtime.callback) {
    runtime.callback->detach();
  }

  release_handlers(runtime.triggers);
  release_handlers(runtime.actions);
  release_handlers(runtime.conditions);
  runtime.bound = false;
}

void RuleBinder::release_handlers(std::vector<BoundModule> &modules) {
  for (auto &slot : modules) {
    ModuleHandler *handler = slot.handler();
    if (handler && slot.factory) {
      slot.factory->release(handler);
    }
    slot.trigger_handler = nullptr;
    slot.condition_handler = nullptr;
    slot.action_handler = nullptr;
    slot.factory.reset();
    slot.outputs.clear();
    slot.connections.reset();
  }
}

} // namespace automation_engine
