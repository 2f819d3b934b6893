#pragma once

#include <optional>

#include "engine/module_handler.hpp"

namespace builtin_modules {

// Linear transform of input "value": result = value * scale + offset,
// optionally clamped to [clamp_min, clamp_max].
class ScaleActionHandler : public automation_engine::ActionHandler {
public:
  // Throws std::runtime_error if 'scale' is missing or the clamp range is
  // inverted.
  explicit ScaleActionHandler(const automation_engine::Module &module);

  // Throws std::runtime_error if input "value" is missing or not numeric.
  automation_engine::ValueMap
  execute(const automation_engine::ValueMap &inputs) override;

  double apply(double value) const;

private:
  double scale_ = 1.0;
  double offset_ = 0.0;
  std::optional<double> clamp_min_;
  std::optional<double> clamp_max_;
};

} // namespace builtin_modules
