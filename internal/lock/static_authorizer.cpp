#include "static_authorizer.hpp"

namespace resync::lock {

StaticAuthorizer::StaticAuthorizer(const std::vector<Credential>& managers) {
  for (const auto& manager : managers) pins_[manager.employee_id] = manager.pin;
}

bool StaticAuthorizer::IsManager(const Credential& credential) const {
  if (credential.employee_id.empty() || credential.pin.empty()) return false;

  auto it = pins_.find(credential.employee_id);
  return it != pins_.end() && it->second == credential.pin;
}

} // namespace resync::lock
