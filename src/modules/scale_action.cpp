#include "modules/scale_action.hpp"

#include <algorithm>
#include <stdexcept>

namespace builtin_modules {

ScaleActionHandler::ScaleActionHandler(
    const automation_engine::Module &module) {
  auto scale = automation_engine::number_at(module.config, "scale");
  if (!scale) {
    throw std::runtime_error("ScaleAction '" + module.id +
                             "': missing required parameter 'scale'");
  }
  scale_ = *scale;
  offset_ = automation_engine::number_at(module.config, "offset").value_or(0.0);
  clamp_min_ = automation_engine::number_at(module.config, "clamp_min");
  clamp_max_ = automation_engine::number_at(module.config, "clamp_max");

  if (clamp_min_ && clamp_max_ && *clamp_min_ > *clamp_max_) {
    throw std::runtime_error("ScaleAction '" + module.id +
                             "': clamp_min must be <= clamp_max");
  }
}

double ScaleActionHandler::apply(double value) const {
  double result = value * scale_ + offset_;
  if (clamp_min_) {
    result = std::max(result, *clamp_min_);
  }
  if (clamp_max_) {
    result = std::min(result, *clamp_max_);
  }
  return result;
}

automation_engine::ValueMap
ScaleActionHandler::execute(const automation_engine::ValueMap &inputs) {
  auto value = automation_engine::number_at(inputs, "value");
  if (!value) {
    throw std::runtime_error("input 'value' missing or not numeric");
  }

  automation_engine::ValueMap outputs;
  outputs["result"] = automation_engine::make_double(apply(*value));
  return outputs;
}

} // namespace builtin_modules
