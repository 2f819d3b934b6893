#include "core/handlers.hpp"

#include <set>
#include <string>

#include "core/health.hpp"
#include "core/transport/framed_stdio.hpp"

namespace handlers {

using automation::v1::FireTriggerRequest;
using automation::v1::GetHealthRequest;
using automation::v1::GetRuleRequest;
using automation::v1::GetStatusRequest;
using automation::v1::HelloRequest;
using automation::v1::ListRulesRequest;
using automation::v1::RemoveRuleRequest;
using automation::v1::Response;
using automation::v1::SetEnabledRequest;
using automation::v1::Status;

static inline void set_status_ok(Response &resp) {
  resp.mutable_status()->set_code(Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

static inline void set_status(Response &resp, Status::Code code,
                              const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

static automation::v1::ModuleKind
to_proto_kind(automation_engine::ModuleKind kind) {
  switch (kind) {
  case automation_engine::ModuleKind::Trigger:
    return automation::v1::MODULE_KIND_TRIGGER;
  case automation_engine::ModuleKind::Condition:
    return automation::v1::MODULE_KIND_CONDITION;
  case automation_engine::ModuleKind::Action:
    return automation::v1::MODULE_KIND_ACTION;
  }
  return automation::v1::MODULE_KIND_UNSPECIFIED;
}

static void fill_module_info(const automation_engine::Module &module,
                             automation::v1::ModuleInfo *out) {
  out->set_module_id(module.id);
  out->set_kind(to_proto_kind(module.kind));
  out->set_type_uid(module.type_uid);
  out->set_label(module.label);
  out->set_description(module.description);
  for (const auto &[key, value] : module.config) {
    (*out->mutable_config())[key] = value;
  }
  for (const auto &connection : module.connections) {
    (*out->mutable_inputs())[connection.input_name] =
        automation_engine::format_reference(connection);
  }
}

automation::v1::RuleStatusInfo
to_status_info(const std::string &rule_id,
               const automation_engine::RuleStatus &status) {
  automation::v1::RuleStatusInfo info;
  info.set_rule_id(rule_id);
  info.set_initialized(status.initialized);
  info.set_enabled(status.enabled);
  info.set_running(status.running);
  for (const auto &error : status.errors) {
    auto *out = info.add_errors();
    out->set_code(
        error.code == automation_engine::RuleErrorCode::MissingHandler
            ? automation::v1::RuleError::CODE_MISSING_HANDLER
            : automation::v1::RuleError::CODE_INVALID_CONNECTION);
    out->set_message(error.message);
  }
  return info;
}

automation::v1::RuleInfo
to_rule_info(const automation_engine::Rule &rule,
             const std::optional<automation_engine::RuleStatus> &status) {
  automation::v1::RuleInfo info;
  info.set_rule_id(rule.id);
  info.set_label(rule.label);
  info.set_description(rule.description);
  for (const auto &tag : rule.tags) {
    info.add_tags(tag);
  }
  info.set_scope(rule.scope);
  for (const auto &module : rule.triggers) {
    fill_module_info(module, info.add_triggers());
  }
  for (const auto &module : rule.conditions) {
    fill_module_info(module, info.add_conditions());
  }
  for (const auto &module : rule.actions) {
    fill_module_info(module, info.add_actions());
  }
  if (status) {
    *info.mutable_status() = to_status_info(rule.id, *status);
  }
  return info;
}

void handle_hello(Context &ctx, const HelloRequest &req, Response &resp) {
  if (req.protocol_version() != "v1") {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  auto *hello = resp.mutable_hello();
  hello->set_protocol_version("v1");
  hello->set_engine_name(ctx.engine_name);
  hello->set_engine_version("0.1.0");

  (*hello->mutable_metadata())["transport"] = "stdio+uint32_le";
  (*hello->mutable_metadata())["max_frame_bytes"] =
      std::to_string(transport::kMaxFrameBytes);
  (*hello->mutable_metadata())["builtin_modules"] =
      ctx.builtins ? "true" : "false";

  set_status_ok(resp);
}

void handle_list_rules(Context &ctx, const ListRulesRequest &req,
                       Response &resp) {
  std::vector<automation_engine::Rule> rules;
  if (req.tags_size() == 0) {
    rules = ctx.engine.get_rules();
  } else {
    std::set<std::string> tags(req.tags().begin(), req.tags().end());
    rules = ctx.engine.get_rules_by_tags(tags);
  }

  auto *out = resp.mutable_list_rules();
  for (const auto &rule : rules) {
    *out->add_rules() = to_rule_info(rule, ctx.engine.get_status(rule.id));
  }
  set_status_ok(resp);
}

void handle_get_rule(Context &ctx, const GetRuleRequest &req,
                     Response &resp) {
  if (req.rule_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "rule_id is required");
    return;
  }

  auto rule = ctx.engine.get_rule(req.rule_id());
  if (!rule) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown rule_id: " + req.rule_id());
    return;
  }

  *resp.mutable_get_rule()->mutable_rule() =
      to_rule_info(*rule, ctx.engine.get_status(rule->id));
  set_status_ok(resp);
}

void handle_get_status(Context &ctx, const GetStatusRequest &req,
                       Response &resp) {
  if (req.rule_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "rule_id is required");
    return;
  }

  auto status = ctx.engine.get_status(req.rule_id());
  if (!status) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown rule_id: " + req.rule_id());
    return;
  }

  *resp.mutable_get_status()->mutable_status() =
      to_status_info(req.rule_id(), *status);
  set_status_ok(resp);
}

void handle_set_enabled(Context &ctx, const SetEnabledRequest &req,
                        Response &resp) {
  if (req.rule_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "rule_id is required");
    return;
  }

  if (!ctx.engine.set_enabled(req.rule_id(), req.enabled())) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown rule_id: " + req.rule_id());
    return;
  }

  auto status = ctx.engine.get_status(req.rule_id());
  if (status) {
    *resp.mutable_set_enabled()->mutable_status() =
        to_status_info(req.rule_id(), *status);
  }
  set_status_ok(resp);
}

void handle_remove_rule(Context &ctx, const RemoveRuleRequest &req,
                        Response &resp) {
  if (req.rule_id().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "rule_id is required");
    return;
  }

  auto removed = ctx.engine.remove_rule(req.rule_id());
  if (!removed) {
    set_status(resp, Status::CODE_NOT_FOUND,
               "unknown rule_id: " + req.rule_id());
    return;
  }

  *resp.mutable_remove_rule()->mutable_rule() =
      to_rule_info(*removed, std::nullopt);
  set_status_ok(resp);
}

void handle_fire_trigger(Context &ctx, const FireTriggerRequest &req,
                         Response &resp) {
  if (!ctx.builtins) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "built-in modules are disabled");
    return;
  }
  if (req.channel().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "channel is required");
    return;
  }

  automation_engine::ValueMap outputs;
  for (const auto &[name, value] : req.outputs()) {
    outputs[name] = value;
  }
  std::size_t fired = ctx.builtins->fire(req.channel(), outputs);

  resp.mutable_fire_trigger()->set_fired_count(static_cast<uint32_t>(fired));
  set_status_ok(resp);
}

void handle_get_health(Context &ctx, const GetHealthRequest & /*req*/,
                       Response &resp) {
  *resp.mutable_get_health() = engine_health::make_engine_health(ctx.engine);
  set_status_ok(resp);
}

void handle_unimplemented(Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "operation not implemented");
}

void dispatch(Context &ctx, const automation::v1::Request &req,
              Response &resp) {
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  try {
    if (req.has_hello()) {
      handle_hello(ctx, req.hello(), resp);
    } else if (req.has_list_rules()) {
      handle_list_rules(ctx, req.list_rules(), resp);
    } else if (req.has_get_rule()) {
      handle_get_rule(ctx, req.get_rule(), resp);
    } else if (req.has_get_status()) {
      handle_get_status(ctx, req.get_status(), resp);
    } else if (req.has_set_enabled()) {
      handle_set_enabled(ctx, req.set_enabled(), resp);
    } else if (req.has_remove_rule()) {
      handle_remove_rule(ctx, req.remove_rule(), resp);
    } else if (req.has_fire_trigger()) {
      handle_fire_trigger(ctx, req.fire_trigger(), resp);
    } else if (req.has_get_health()) {
      handle_get_health(ctx, req.get_health(), resp);
    } else {
      handle_unimplemented(resp);
    }
  } catch (const std::exception &e) {
    resp.clear_kind();
    set_status(resp, Status::CODE_INTERNAL, e.what());
  }
}

} // namespace handlers
