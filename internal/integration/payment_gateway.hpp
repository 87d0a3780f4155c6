#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace resync::integration {

struct PaymentRequest {
  std::string payment_id;
  std::string check_id;
  std::string tender_type;
  int64_t     amount_cents = 0;
  int64_t     tip_cents    = 0;
  // Gateways must treat a repeated key as the same authorization.
  std::string idempotency_key;
};

struct PaymentResult {
  bool        approved = false;
  std::string reference;
  std::string decline_reason;
};

// Card processor wrapper. Implementations are selected by Type().
class PaymentGatewayAdapter {
 public:
  virtual ~PaymentGatewayAdapter() = default;

  virtual std::string_view Type() const = 0;

  virtual PaymentResult Authorize(const PaymentRequest& request)                   = 0;
  virtual PaymentResult Capture(const std::string& reference, int64_t amount_cents) = 0;
  virtual void          Void(const std::string& reference)                         = 0;
};

} // namespace resync::integration
