#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "engine/module_handler.hpp"

namespace automation_engine {

/**
 * @brief Maps system module types to the factory serving them.
 *
 * Not synchronized: the owning RuleEngine calls it under its engine mutex.
 *
 * Duplicate registration for a type is resolved last-wins; the shadowed
 * factory keeps whatever handlers it already created until their rules are
 * unbound.
 */
class HandlerRegistry {
public:
  HandlerRegistry() = default;

  HandlerRegistry(const HandlerRegistry &) = delete;
  HandlerRegistry &operator=(const HandlerRegistry &) = delete;

  // Record every supported type of the factory. Returns the types now mapped
  // to it (empty when the registry is closed).
  std::vector<std::string> add(const std::shared_ptr<HandlerFactory> &factory);

  // Drop the types currently mapped to this factory. Types that a later
  // registration took over are left alone. Returns the removed types.
  std::vector<std::string>
  remove(const std::shared_ptr<HandlerFactory> &factory);

  // Factory for a module type identifier; sub-types resolve to their system
  // type. nullptr if none is registered.
  std::shared_ptr<HandlerFactory> find(const std::string &type_uid) const;

  std::vector<std::string> registered_types() const;
  std::size_t size() const { return factories_.size(); }

  // Close the registry: drops every factory and ignores later add() calls.
  void close();
  bool is_closed() const { return closed_; }

private:
  std::map<std::string, std::shared_ptr<HandlerFactory>> factories_;
  bool closed_ = false;
};

} // namespace automation_engine
