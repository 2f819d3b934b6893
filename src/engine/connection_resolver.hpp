#pragma once

#include <map>
#include <string>
#include <vector>

#include "engine/rule_runtime.hpp"
#include "model/rule.hpp"

namespace automation_engine {

// Bind-time check of every condition/action connection. One
// InvalidConnection error per connection whose source is missing, is the
// module itself, or does not produce outputs.
std::vector<RuleError> validate_connections(const Rule &rule);

// Input wiring of a condition or action: input name -> OutputRef. Built on
// first use and cached on the module until the rule is unbound. Bad
// connections are logged and skipped.
const std::map<std::string, OutputRef> &
resolve_connections(RuleRuntime &runtime, BoundModule &module);

// Current values behind the references. Inputs whose source has not produced
// the output yet are omitted.
ValueMap collect_inputs(const std::map<std::string, OutputRef> &connections);

} // namespace automation_engine
