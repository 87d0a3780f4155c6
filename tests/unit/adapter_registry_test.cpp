#include "internal/integration/adapter_registry.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace {

using resync::integration::OrderParserRegistry;
using resync::integration::PaymentGatewayRegistry;
using resync::integration::PaymentRequest;
using resync::integration::PaymentResult;

// Approves everything below a ceiling and replays idempotent retries.
class TestGateway final : public resync::integration::PaymentGatewayAdapter {
 public:
  std::string_view Type() const override {
    return "test";
  }

  PaymentResult Authorize(const PaymentRequest& request) override {
    auto it = by_key_.find(request.idempotency_key);
    if (it != by_key_.end()) return it->second;

    PaymentResult result;
    result.approved = request.amount_cents <= 10000;
    if (result.approved) {
      result.reference = "auth-" + std::to_string(++sequence_);
    } else {
      result.decline_reason = "over limit";
    }
    by_key_[request.idempotency_key] = result;
    return result;
  }

  PaymentResult Capture(const std::string& reference, int64_t) override {
    return PaymentResult{.approved = true, .reference = reference, .decline_reason = {}};
  }

  void Void(const std::string&) override {}

 private:
  std::map<std::string, PaymentResult> by_key_;
  int                                  sequence_ = 0;
};

class TestParser final : public resync::integration::OrderParser {
 public:
  std::string_view Type() const override {
    return "test-delivery";
  }

  resync::v1::Check ParseOrder(const std::string& property_id, const std::string& body) override {
    if (body.empty()) throw resync::util::InvalidArgument("empty order body");
    resync::v1::Check check;
    check.set_id("ext-" + body);
    check.set_property_id(property_id);
    return check;
  }
};

void TestCreateByTag() {
  PaymentGatewayRegistry registry;
  registry.Register("test", [] { return std::make_shared<TestGateway>(); });

  assert(registry.Contains("test"));
  assert(!registry.Contains("other"));

  auto gateway = registry.Create("test");
  assert(gateway->Type() == "test");

  const PaymentRequest request{.payment_id = "pay-1", .check_id = "chk-1", .tender_type = "card", .amount_cents = 2500, .tip_cents = 300,
                               .idempotency_key = "pay-1"};
  const auto first = gateway->Authorize(request);
  assert(first.approved);
  assert(gateway->Authorize(request).reference == first.reference);

  auto declined = gateway->Authorize({.payment_id = "pay-2", .check_id = "chk-1", .tender_type = "card", .amount_cents = 50000,
                                      .tip_cents = 0, .idempotency_key = "pay-2"});
  assert(!declined.approved);
  assert(declined.decline_reason == "over limit");

  // Each Create builds a fresh adapter.
  assert(registry.Create("test") != gateway);
}

void TestRegistrationErrors() {
  OrderParserRegistry registry;
  registry.Register("test-delivery", [] { return std::make_shared<TestParser>(); });

  bool threw = false;
  try {
    registry.Register("test-delivery", [] { return std::make_shared<TestParser>(); });
  } catch (const resync::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Register("", [] { return std::make_shared<TestParser>(); });
  } catch (const resync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Create("unknown");
  } catch (const resync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto check = registry.Create("test-delivery")->ParseOrder("downtown", "123");
  assert(check.id() == "ext-123");
  assert(check.property_id() == "downtown");
  assert(registry.Types().size() == 1);
}

} // namespace

int main() {
  TestCreateByTag();
  TestRegistrationErrors();

  std::cout << "resync_unit_adapter_registry: pass\n";
  return 0;
}
