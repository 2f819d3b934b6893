#pragma once

#include <string>

#include "automation.pb.h"
#include "engine/rule_engine.hpp"

namespace engine_health {

// STOPPED once disposed, DEGRADED while any rule is uninitialized, else OK.
inline automation::v1::GetHealthResponse
make_engine_health(const automation_engine::RuleEngine &engine) {
  automation::v1::GetHealthResponse h;

  if (engine.is_disposed()) {
    h.set_state(automation::v1::GetHealthResponse::STATE_STOPPED);
    h.set_message("disposed");
    return h;
  }

  uint32_t rules = 0;
  uint32_t initialized = 0;
  uint32_t enabled = 0;
  for (const auto &rule : engine.get_rules()) {
    ++rules;
    auto status = engine.get_status(rule.id);
    if (!status) {
      continue;
    }
    if (status->initialized)
      ++initialized;
    if (status->enabled)
      ++enabled;
  }

  h.set_rule_count(rules);
  h.set_initialized_count(initialized);
  h.set_enabled_count(enabled);
  for (const auto &type : engine.registered_types()) {
    h.add_registered_types(type);
  }

  if (initialized < rules) {
    h.set_state(automation::v1::GetHealthResponse::STATE_DEGRADED);
    h.set_message(std::to_string(rules - initialized) +
                  " rule(s) uninitialized");
  } else {
    h.set_state(automation::v1::GetHealthResponse::STATE_OK);
    h.set_message("ok");
  }

  (*h.mutable_metrics())["impl"] = "automation-engine";
  (*h.mutable_metrics())["factory_types"] =
      std::to_string(h.registered_types_size());
  return h;
}

} // namespace engine_health
