#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "automation.pb.h"
#include "config.hpp"
#include "core/handlers.hpp"
#include "core/transport/framed_stdio.hpp"
#include "engine/rule_engine.hpp"
#include "modules/builtin_factory.hpp"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "automation-engine: " << msg << "\n";
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    log_err("Usage: automation-engine --config <path/to/config.yaml>");
    return 1;
  }

  automation_engine::RuleEngine engine;
  std::shared_ptr<builtin_modules::BuiltinHandlerFactory> builtins;
  automation_engine::EngineConfig config;

  try {
    log_err("loading configuration from: " + *config_path);
    config = automation_engine::load_config(*config_path);

    if (config.builtin_modules) {
      builtins = std::make_shared<builtin_modules::BuiltinHandlerFactory>();
      engine.register_factory(builtins);
    } else {
      log_err("built-in modules disabled");
    }

    for (const auto &rule : config.rules) {
      engine.set_rule(rule);
    }
    log_err("installed " + std::to_string(config.rules.size()) +
            " rules from config");
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to initialize engine: " + std::string(e.what()));
    return 1;
  }

  for (const auto &rule : config.rules) {
    auto status = engine.get_status(rule.id);
    if (status && !status->initialized) {
      log_err("WARNING: rule '" + rule.id + "' is not initialized (" +
              std::to_string(status->errors.size()) + " error(s))");
    }
  }

  handlers::Context ctx{engine, builtins.get(), config.engine_name};

  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    frame.clear();
    if (!transport::read_frame(std::cin, frame, io_err)) {
      engine.dispose();
      if (io_err.empty()) {
        log_err("EOF on stdin; exiting cleanly");
        return 0;
      }
      log_err("read_frame error: " + io_err);
      return 2;
    }

    automation::v1::Request req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      log_err("failed to parse Request protobuf");
      engine.dispose();
      return 3;
    }

    automation::v1::Response resp;
    handlers::dispatch(ctx, req, resp);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      engine.dispose();
      return 4;
    }

    if (!transport::write_frame(std::cout, resp_bytes, io_err)) {
      log_err("write_frame error: " + io_err);
      engine.dispose();
      return 5;
    }
  }
}
