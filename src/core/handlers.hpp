#pragma once

#include <optional>
#include <string>

#include "automation.pb.h"
#include "engine/rule_engine.hpp"
#include "model/rule.hpp"
#include "modules/builtin_factory.hpp"

namespace handlers {

// What the control handlers operate on. builtins is null when the built-in
// module types are disabled in the configuration.
struct Context {
  automation_engine::RuleEngine &engine;
  builtin_modules::BuiltinHandlerFactory *builtins = nullptr;
  std::string engine_name = "automation-engine";
};

automation::v1::RuleStatusInfo
to_status_info(const std::string &rule_id,
               const automation_engine::RuleStatus &status);

automation::v1::RuleInfo
to_rule_info(const automation_engine::Rule &rule,
             const std::optional<automation_engine::RuleStatus> &status);

void handle_hello(Context &ctx, const automation::v1::HelloRequest &req,
                  automation::v1::Response &resp);

void handle_list_rules(Context &ctx,
                       const automation::v1::ListRulesRequest &req,
                       automation::v1::Response &resp);

void handle_get_rule(Context &ctx, const automation::v1::GetRuleRequest &req,
                     automation::v1::Response &resp);

void handle_get_status(Context &ctx,
                       const automation::v1::GetStatusRequest &req,
                       automation::v1::Response &resp);

void handle_set_enabled(Context &ctx,
                        const automation::v1::SetEnabledRequest &req,
                        automation::v1::Response &resp);

void handle_remove_rule(Context &ctx,
                        const automation::v1::RemoveRuleRequest &req,
                        automation::v1::Response &resp);

void handle_fire_trigger(Context &ctx,
                         const automation::v1::FireTriggerRequest &req,
                         automation::v1::Response &resp);

void handle_get_health(Context &ctx,
                       const automation::v1::GetHealthRequest &req,
                       automation::v1::Response &resp);

void handle_unimplemented(automation::v1::Response &resp);

// Route a request to its handler; the response echoes request_id.
void dispatch(Context &ctx, const automation::v1::Request &req,
              automation::v1::Response &resp);

} // namespace handlers
