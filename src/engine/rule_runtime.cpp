#include "engine/rule_runtime.hpp"

namespace automation_engine {

std::optional<Value> OutputRef::value() const {
  if (!outputs_) {
    return std::nullopt;
  }
  auto it = outputs_->find(output_name_);
  if (it == outputs_->end()) {
    return std::nullopt;
  }
  return it->second;
}

ModuleHandler *BoundModule::handler() const {
  if (trigger_handler) {
    return trigger_handler;
  }
  if (condition_handler) {
    return condition_handler;
  }
  return action_handler;
}

static std::vector<BoundModule> bind_slots(const std::vector<Module> &modules) {
  std::vector<BoundModule> slots(modules.size());
  for (std::size_t i = 0; i < modules.size(); ++i) {
    slots[i].module = &modules[i];
  }
  return slots;
}

RuleRuntime::RuleRuntime(Rule definition)
    : rule(std::move(definition)), triggers(bind_slots(rule.triggers)),
      conditions(bind_slots(rule.conditions)),
      actions(bind_slots(rule.actions)) {}

BoundModule *RuleRuntime::find(const std::string &module_id) {
  for (auto *slots : {&triggers, &conditions, &actions}) {
    for (auto &slot : *slots) {
      if (slot.module->id == module_id) {
        return &slot;
      }
    }
  }
  return nullptr;
}

BoundModule *RuleRuntime::find_trigger(const std::string &module_id) {
  for (auto &slot : triggers) {
    if (slot.module->id == module_id) {
      return &slot;
    }
  }
  return nullptr;
}

} // namespace automation_engine
