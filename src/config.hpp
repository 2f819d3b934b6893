#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "model/rule.hpp"
#include "model/value.hpp"

namespace automation_engine {

// Complete engine configuration
struct EngineConfig {
  std::string config_file_path; // Absolute path (for relative resolution)
  std::string engine_name = "automation-engine";
  bool builtin_modules = true; // Register the core.* handler factory
  std::vector<Rule> rules;     // Inline rules followed by rule_files rules
};

// Load engine configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
EngineConfig load_config(const std::string &path);

// Parse a 'rules' sequence. 'origin' names the file in error messages.
// Throws std::runtime_error
std::vector<Rule> parse_rules(const YAML::Node &rules_node,
                              const std::string &origin);

// Scalar conversion: bool literal, then int64, then double, else string.
// Non-scalar nodes are rejected with std::runtime_error.
Value value_from_yaml(const YAML::Node &node);

} // namespace automation_engine
