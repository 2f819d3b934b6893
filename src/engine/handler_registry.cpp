#include "engine/handler_registry.hpp"

#include <iostream>

namespace automation_engine {

std::vector<std::string>
HandlerRegistry::add(const std::shared_ptr<HandlerFactory> &factory) {
  std::vector<std::string> added;
  if (closed_ || !factory) {
    return added;
  }

  for (const auto &type : factory->supported_types()) {
    auto it = factories_.find(type);
    if (it != factories_.end() && it->second != factory) {
      std::cerr << "[HandlerRegistry] Warning: factory for module type '"
                << type << "' replaced by a later registration" << std::endl;
    }
    factories_[type] = factory;
    added.push_back(type);
  }

  return added;
}

std::vector<std::string>
HandlerRegistry::remove(const std::shared_ptr<HandlerFactory> &factory) {
  std::vector<std::string> removed;
  if (!factory) {
    return removed;
  }

  for (auto it = factories_.begin(); it != factories_.end();) {
    if (it->second == factory) {
      removed.push_back(it->first);
      it = factories_.erase(it);
    } else {
      ++it;
    }
  }

  return removed;
}

std::shared_ptr<HandlerFactory>
HandlerRegistry::find(const std::string &type_uid) const {
  auto it = factories_.find(system_module_type(type_uid));
  if (it == factories_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> HandlerRegistry::registered_types() const {
  std::vector<std::string> types;
  types.reserve(factories_.size());
  for (const auto &kv : factories_) {
    types.push_back(kv.first);
  }
  return types;
}

void HandlerRegistry::close() {
  closed_ = true;
  factories_.clear();
}

} // namespace automation_engine
