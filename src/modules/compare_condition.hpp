#pragma once

#include <optional>
#include <string>

#include "engine/module_handler.hpp"

namespace builtin_modules {

enum class CompareOp { Less, Greater, LessEqual, GreaterEqual, Equal, NotEqual };

// Throws std::runtime_error for anything but < > <= >= == !=
CompareOp parse_compare_op(const std::string &op);

// == and != use an absolute tolerance of 1e-6
bool compare(double lhs, CompareOp op, double rhs);

/**
 * Condition comparing input "value" against input "right", or against
 * config "threshold" when "right" is not connected.
 *
 * Numbers compare with every operator. Other values only support == and !=.
 * A missing operand never satisfies the condition.
 */
class CompareConditionHandler : public automation_engine::ConditionHandler {
public:
  explicit CompareConditionHandler(const automation_engine::Module &module);

  bool is_satisfied(const automation_engine::ValueMap &inputs) override;

  CompareOp op() const { return op_; }

private:
  CompareOp op_;
  std::optional<automation_engine::Value> threshold_;
};

} // namespace builtin_modules
