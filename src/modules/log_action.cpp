#include "modules/log_action.hpp"

namespace builtin_modules {

LogActionHandler::LogActionHandler(const automation_engine::Module &module,
                                   std::ostream &out)
    : module_id_(module.id),
      message_(automation_engine::string_at(module.config, "message")
                   .value_or("")),
      out_(out) {}

automation_engine::ValueMap
LogActionHandler::execute(const automation_engine::ValueMap &inputs) {
  std::string line = message_;
  if (!inputs.empty()) {
    if (!line.empty()) {
      line += " ";
    }
    line += automation_engine::to_display_string(inputs);
  }

  out_ << "[LogAction] " << module_id_ << ": " << line << std::endl;

  automation_engine::ValueMap outputs;
  outputs["message"] = automation_engine::make_string(line);
  return outputs;
}

} // namespace builtin_modules
