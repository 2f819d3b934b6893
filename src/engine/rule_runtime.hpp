#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/module_handler.hpp"
#include "model/rule.hpp"

namespace automation_engine {

class RuleCallback;

// Live reference to one output slot of a trigger or action.
class OutputRef {
public:
  OutputRef(const ValueMap *outputs, std::string output_name)
      : outputs_(outputs), output_name_(std::move(output_name)) {}

  // Current value; nullopt until the source module has produced it.
  std::optional<Value> value() const;

  const std::string &output_name() const { return output_name_; }

private:
  const ValueMap *outputs_;
  std::string output_name_;
};

// Runtime side of one module: its borrowed handler, the factory that made
// it, its output holder and the cached input wiring.
struct BoundModule {
  const Module *module = nullptr;

  std::shared_ptr<HandlerFactory> factory;
  TriggerHandler *trigger_handler = nullptr;
  ConditionHandler *condition_handler = nullptr;
  ActionHandler *action_handler = nullptr;

  ValueMap outputs;
  std::optional<std::map<std::string, OutputRef>> connections;

  ModuleHandler *handler() const;
  bool is_bound() const { return handler() != nullptr; }
};

/**
 * @brief Engine-owned state of one rule.
 *
 * Holds its own copy of the definition; the BoundModule vectors run parallel
 * to the definition's module lists and keep pointers into it, so a
 * RuleRuntime is never copied or moved once built.
 */
struct RuleRuntime {
  explicit RuleRuntime(Rule definition);

  RuleRuntime(const RuleRuntime &) = delete;
  RuleRuntime &operator=(const RuleRuntime &) = delete;

  const std::string &id() const { return rule.id; }

  BoundModule *find(const std::string &module_id);
  BoundModule *find_trigger(const std::string &module_id);

  const Rule rule;
  std::vector<BoundModule> triggers;
  std::vector<BoundModule> conditions;
  std::vector<BoundModule> actions;

  bool bound = false;

  // Created on the first successful bind and kept until the rule is removed.
  std::shared_ptr<RuleCallback> callback;
};

} // namespace automation_engine
