#include "engine/module_handler.hpp"

#include <iostream>

namespace automation_engine {

void OwningHandlerFactory::release(ModuleHandler *handler) {
  if (!handler) {
    return;
  }

  on_release(handler);

  std::unique_ptr<ModuleHandler> owned;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(handler);
    if (it == handlers_.end()) {
      std::cerr << "[HandlerFactory] Warning: release of unknown handler"
                << std::endl;
      return;
    }
    owned = std::move(it->second);
    handlers_.erase(it);
  }
  // Destroyed outside the lock: handler destructors may join threads
}

std::size_t OwningHandlerFactory::live_handler_count() const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.size();
}

} // namespace automation_engine
