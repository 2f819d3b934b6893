#include "config.hpp"
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <set>
#include <stdexcept>

namespace automation_engine {

namespace fs = std::filesystem;

Value value_from_yaml(const YAML::Node &node) {
  if (!node.IsScalar()) {
    throw std::runtime_error("expected a scalar value");
  }

  const std::string &scalar = node.Scalar();

  // Only the literal spellings count as bool ("yes"/"on" stay strings)
  if (scalar == "true" || scalar == "false" || scalar == "True" ||
      scalar == "False" || scalar == "TRUE" || scalar == "FALSE") {
    return make_bool(node.as<bool>());
  }

  // int64 only without decimal point or exponent
  if (scalar.find('.') == std::string::npos &&
      scalar.find('e') == std::string::npos &&
      scalar.find('E') == std::string::npos) {
    try {
      return make_int64(node.as<int64_t>());
    } catch (const YAML::BadConversion &) {
      // Not an integer; try the wider forms below
    }
  }

  try {
    return make_double(node.as<double>());
  } catch (const YAML::BadConversion &) {
    return make_string(scalar);
  }
}

static std::string optional_string(const YAML::Node &node,
                                   const std::string &key,
                                   const std::string &where) {
  if (!node[key]) {
    return "";
  }
  try {
    return node[key].as<std::string>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid " + where + "." + key + ": " +
                             e.what());
  }
}

static std::vector<Module> parse_modules(const YAML::Node &rule_node,
                                         const std::string &section,
                                         ModuleKind kind,
                                         const std::string &where) {
  std::vector<Module> modules;
  const YAML::Node list = rule_node[section];
  if (!list) {
    return modules;
  }
  if (!list.IsSequence()) {
    throw std::runtime_error("[CONFIG] " + where + "." + section +
                             " must be a sequence");
  }

  for (std::size_t i = 0; i < list.size(); ++i) {
    const YAML::Node &node = list[i];
    std::string entry = where + "." + section + "[" + std::to_string(i) + "]";

    if (!node.IsMap()) {
      throw std::runtime_error("[CONFIG] Invalid " + entry +
                               ": entry must be a map");
    }
    if (!node["id"]) {
      throw std::runtime_error("[CONFIG] Invalid " + entry +
                               ": missing required field 'id'");
    }
    if (!node["type"]) {
      throw std::runtime_error("[CONFIG] Invalid " + entry +
                               ": missing required field 'type'");
    }

    Module module;
    module.kind = kind;
    module.id = optional_string(node, "id", entry);
    module.type_uid = optional_string(node, "type", entry);
    module.label = optional_string(node, "label", entry);
    module.description = optional_string(node, "description", entry);

    if (node["config"]) {
      if (!node["config"].IsMap()) {
        throw std::runtime_error("[CONFIG] " + entry +
                                 ".config must be a map");
      }
      for (const auto &kv : node["config"]) {
        std::string key = kv.first.as<std::string>();
        try {
          module.config[key] = value_from_yaml(kv.second);
        } catch (const std::exception &e) {
          throw std::runtime_error("[CONFIG] Invalid " + entry + ".config." +
                                   key + ": " + e.what());
        }
      }
    }

    if (node["inputs"]) {
      if (kind == ModuleKind::Trigger) {
        throw std::runtime_error("[CONFIG] " + entry +
                                 ": triggers cannot have inputs");
      }
      if (!node["inputs"].IsMap()) {
        throw std::runtime_error("[CONFIG] " + entry +
                                 ".inputs must be a map");
      }
      for (const auto &kv : node["inputs"]) {
        std::string input = kv.first.as<std::string>();
        std::string reference = kv.second.as<std::string>();
        auto connection = parse_connection(input, reference);
        if (!connection) {
          throw std::runtime_error(
              "[CONFIG] Invalid " + entry + ".inputs." + input + ": '" +
              reference + "'. Expected format: 'module_id.output_name'");
        }
        module.connections.push_back(*connection);
      }
    }

    modules.push_back(std::move(module));
  }

  return modules;
}

std::vector<Rule> parse_rules(const YAML::Node &rules_node,
                              const std::string &origin) {
  std::vector<Rule> rules;
  if (!rules_node) {
    return rules;
  }
  if (!rules_node.IsSequence()) {
    throw std::runtime_error("[CONFIG] " + origin +
                             ": 'rules' must be a sequence");
  }

  for (std::size_t i = 0; i < rules_node.size(); ++i) {
    const YAML::Node &node = rules_node[i];
    std::string where = "rules[" + std::to_string(i) + "]";

    if (!node.IsMap()) {
      throw std::runtime_error("[CONFIG] Invalid " + where +
                               ": entry must be a map");
    }
    if (!node["id"]) {
      throw std::runtime_error("[CONFIG] Invalid " + where +
                               ": missing required field 'id'");
    }

    Rule rule;
    rule.id = optional_string(node, "id", where);
    where = "rule '" + rule.id + "'";
    rule.label = optional_string(node, "label", where);
    rule.description = optional_string(node, "description", where);
    rule.scope = optional_string(node, "scope", where);

    if (node["tags"]) {
      if (!node["tags"].IsSequence()) {
        throw std::runtime_error("[CONFIG] " + where +
                                 ".tags must be a sequence");
      }
      for (const auto &tag : node["tags"]) {
        rule.tags.insert(tag.as<std::string>());
      }
    }

    if (node["enabled"]) {
      try {
        rule.initial_enabled = node["enabled"].as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error("[CONFIG] " + where +
                                 ".enabled must be true or false");
      }
    }

    rule.triggers =
        parse_modules(node, "triggers", ModuleKind::Trigger, where);
    rule.conditions =
        parse_modules(node, "conditions", ModuleKind::Condition, where);
    rule.actions = parse_modules(node, "actions", ModuleKind::Action, where);

    try {
      validate_rule(rule);
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error("[CONFIG] Invalid " + where + " in " + origin +
                               ": " + e.what());
    }

    rules.push_back(std::move(rule));
  }

  return rules;
}

static YAML::Node load_yaml(const std::string &path) {
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }
}

EngineConfig load_config(const std::string &path) {
  YAML::Node yaml = load_yaml(path);

  EngineConfig config;
  config.config_file_path = fs::absolute(path).string();

  if (yaml["engine"]) {
    const YAML::Node &engine = yaml["engine"];
    if (!engine.IsMap()) {
      throw std::runtime_error("[CONFIG] 'engine' section must be a map");
    }
    if (engine["name"]) {
      config.engine_name = engine["name"].as<std::string>();
    }
    if (engine["builtin_modules"]) {
      try {
        config.builtin_modules = engine["builtin_modules"].as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error(
            "[CONFIG] engine.builtin_modules must be true or false");
      }
    }
  }

  config.rules = parse_rules(yaml["rules"], path);

  if (yaml["rule_files"]) {
    if (!yaml["rule_files"].IsSequence()) {
      throw std::runtime_error("[CONFIG] 'rule_files' must be a sequence");
    }

    fs::path base = fs::path(config.config_file_path).parent_path();
    for (const auto &entry : yaml["rule_files"]) {
      fs::path file = entry.as<std::string>();
      if (file.is_relative()) {
        file = base / file;
      }

      YAML::Node rule_yaml = load_yaml(file.string());
      if (!rule_yaml["rules"]) {
        throw std::runtime_error("[CONFIG] Rule file '" + file.string() +
                                 "' has no 'rules' section");
      }
      auto rules = parse_rules(rule_yaml["rules"], file.string());
      config.rules.insert(config.rules.end(),
                          std::make_move_iterator(rules.begin()),
                          std::make_move_iterator(rules.end()));
    }
  }

  std::set<std::string> ids;
  for (const auto &rule : config.rules) {
    if (!ids.insert(rule.id).second) {
      throw std::runtime_error("[CONFIG] Duplicate rule id '" + rule.id + "'");
    }
  }

  return config;
}

} // namespace automation_engine
