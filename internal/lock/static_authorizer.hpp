#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "holder.hpp"

namespace resync::lock {

// Manager credentials loaded from configuration.
class StaticAuthorizer final : public Authorizer {
 public:
  explicit StaticAuthorizer(const std::vector<Credential>& managers);

  bool IsManager(const Credential& credential) const override;

 private:
  std::unordered_map<std::string, std::string> pins_;
};

} // namespace resync::lock
