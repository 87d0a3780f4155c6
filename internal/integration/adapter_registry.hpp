#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "order_parser.hpp"
#include "payment_gateway.hpp"

namespace resync::integration {

/*
  Type-tag keyed registry of adapter factories.

      registry.Register("acme", [] { return std::make_shared<AcmeGateway>(); });
      auto gateway = registry.Create(property_gateway_type);

  Callers hold only the tag; no code path branches on a vendor name.
*/
template <typename Adapter>
class AdapterRegistry {
 public:
  using Factory = std::function<std::shared_ptr<Adapter>()>;

  void Register(const std::string& type, Factory factory) {
    if (type.empty()) throw util::InvalidArgument("adapter type is required");
    if (!factory) throw util::InvalidArgument("adapter " + type + " has no factory");

    std::lock_guard lock(mutex_);
    if (!factories_.emplace(type, std::move(factory)).second) {
      throw util::AlreadyExists("adapter " + type + " already registered");
    }
  }

  std::shared_ptr<Adapter> Create(const std::string& type) const {
    Factory factory;
    {
      std::lock_guard lock(mutex_);
      auto            it = factories_.find(type);
      if (it == factories_.end()) throw util::NotFound("no adapter registered for type " + type);
      factory = it->second;
    }
    return factory();
  }

  bool Contains(const std::string& type) const {
    std::lock_guard lock(mutex_);
    return factories_.contains(type);
  }

  std::vector<std::string> Types() const {
    std::lock_guard lock(mutex_);

    std::vector<std::string> types;
    types.reserve(factories_.size());
    for (const auto& [type, _] : factories_) types.push_back(type);
    return types;
  }

 private:
  mutable std::mutex             mutex_;
  std::map<std::string, Factory> factories_;
};

using PaymentGatewayRegistry = AdapterRegistry<PaymentGatewayAdapter>;
using OrderParserRegistry    = AdapterRegistry<OrderParser>;

} // namespace resync::integration
