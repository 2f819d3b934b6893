#include "modules/compare_condition.hpp"

#include <cmath>
#include <stdexcept>

namespace builtin_modules {

using automation_engine::Value;
using automation_engine::ValueMap;

CompareOp parse_compare_op(const std::string &op) {
  if (op == "<")
    return CompareOp::Less;
  if (op == ">")
    return CompareOp::Greater;
  if (op == "<=")
    return CompareOp::LessEqual;
  if (op == ">=")
    return CompareOp::GreaterEqual;
  if (op == "==")
    return CompareOp::Equal;
  if (op == "!=")
    return CompareOp::NotEqual;

  throw std::runtime_error("Unknown comparator: " + op);
}

bool compare(double lhs, CompareOp op, double rhs) {
  switch (op) {
  case CompareOp::Less:
    return lhs < rhs;
  case CompareOp::Greater:
    return lhs > rhs;
  case CompareOp::LessEqual:
    return lhs <= rhs;
  case CompareOp::GreaterEqual:
    return lhs >= rhs;
  case CompareOp::Equal:
    return std::abs(lhs - rhs) < 1e-6;
  case CompareOp::NotEqual:
    return std::abs(lhs - rhs) >= 1e-6;
  }
  return false;
}

CompareConditionHandler::CompareConditionHandler(
    const automation_engine::Module &module) {
  auto op = automation_engine::string_at(module.config, "operator");
  if (!op) {
    throw std::runtime_error("CompareCondition '" + module.id +
                             "': missing required parameter 'operator'");
  }
  op_ = parse_compare_op(*op);

  auto it = module.config.find("threshold");
  if (it != module.config.end()) {
    threshold_ = it->second;
  }
}

bool CompareConditionHandler::is_satisfied(const ValueMap &inputs) {
  auto lhs_it = inputs.find("value");
  if (lhs_it == inputs.end()) {
    return false;
  }

  std::optional<Value> rhs;
  auto rhs_it = inputs.find("right");
  if (rhs_it != inputs.end()) {
    rhs = rhs_it->second;
  } else {
    rhs = threshold_;
  }
  if (!rhs) {
    return false;
  }

  auto lhs_num = automation_engine::as_number(lhs_it->second);
  auto rhs_num = automation_engine::as_number(*rhs);
  if (lhs_num && rhs_num) {
    return compare(*lhs_num, op_, *rhs_num);
  }

  // Non-numeric: equality only
  if (op_ == CompareOp::Equal) {
    return automation_engine::values_equal(lhs_it->second, *rhs);
  }
  if (op_ == CompareOp::NotEqual) {
    return !automation_engine::values_equal(lhs_it->second, *rhs);
  }
  return false;
}

} // namespace builtin_modules
