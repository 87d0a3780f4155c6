#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "resync/v1/types.pb.h"

namespace resync::db::model {

struct LineItemRecord {
  std::string id;
  std::string menu_item_id;
  std::string name;
  int64_t     quantity         = 1;
  int64_t     unit_price_cents = 0;
  uint64_t    updated_at_ms    = 0;
};

/*
  Guest check.

  revision increments on every accepted write and is the optimistic
  concurrency token. A clone created by an offline-holder override is
  non-canonical and points back at the original via conflict_peer_id.
*/
struct CheckRecord {
  std::string id;
  std::string property_id;
  std::string business_date;

  resync::v1::CheckStatus status = resync::v1::CHECK_STATUS_OPEN;

  std::vector<LineItemRecord> line_items;

  int64_t tax_cents      = 0;
  int64_t tip_cents      = 0;
  int64_t discount_cents = 0;
  int64_t guest_count    = 0;

  uint64_t revision = 0;

  resync::v1::ConflictState conflict_state = resync::v1::CONFLICT_STATE_NONE;
  std::string               conflict_peer_id;
  bool                      canonical = true;

  // Terminal that held the lock when the check was cloned away from it.
  std::string displaced_holder;

  uint64_t updated_at_ms = 0;
};

inline int64_t SubtotalCents(const CheckRecord& check) {
  int64_t subtotal = 0;
  for (const auto& item : check.line_items) {
    subtotal += item.quantity * item.unit_price_cents;
  }
  return subtotal;
}

} // namespace resync::db::model
