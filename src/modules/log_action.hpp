#pragma once

#include <ostream>
#include <string>

#include "engine/module_handler.hpp"

namespace builtin_modules {

// Writes "[LogAction] <module>: <message> k=v ..." for every execution and
// returns the line as output "message".
class LogActionHandler : public automation_engine::ActionHandler {
public:
  LogActionHandler(const automation_engine::Module &module, std::ostream &out);

  automation_engine::ValueMap
  execute(const automation_engine::ValueMap &inputs) override;

private:
  std::string module_id_;
  std::string message_;
  std::ostream &out_;
};

} // namespace builtin_modules
