#include "proto_convert.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace resync::db::model {

resync::v1::Check ToProto(const CheckRecord& record) {
  resync::v1::Check check;
  check.set_id(record.id);
  check.set_property_id(record.property_id);
  check.set_business_date(record.business_date);
  check.set_status(record.status);
  for (const auto& item : record.line_items) {
    auto* out = check.add_line_items();
    out->set_id(item.id);
    out->set_menu_item_id(item.menu_item_id);
    out->set_name(item.name);
    out->set_quantity(item.quantity);
    out->set_unit_price_cents(item.unit_price_cents);
    out->set_updated_at_ms(item.updated_at_ms);
  }
  check.set_tax_cents(record.tax_cents);
  check.set_tip_cents(record.tip_cents);
  check.set_discount_cents(record.discount_cents);
  check.set_guest_count(record.guest_count);
  check.set_revision(record.revision);
  check.set_conflict_state(record.conflict_state);
  check.set_conflict_peer_id(record.conflict_peer_id);
  check.set_canonical(record.canonical);
  check.set_displaced_holder(record.displaced_holder);
  check.set_updated_at_ms(record.updated_at_ms);
  return check;
}

resync::v1::Payment ToProto(const PaymentRecord& record) {
  resync::v1::Payment payment;
  payment.set_id(record.id);
  payment.set_check_id(record.check_id);
  payment.set_property_id(record.property_id);
  payment.set_business_date(record.business_date);
  payment.set_tender_type(record.tender_type);
  payment.set_amount_cents(record.amount_cents);
  payment.set_tip_cents(record.tip_cents);
  payment.set_created_at_ms(record.created_at_ms);
  return payment;
}

resync::v1::TimeEntry ToProto(const TimeEntryRecord& record) {
  resync::v1::TimeEntry entry;
  entry.set_id(record.id);
  entry.set_property_id(record.property_id);
  entry.set_employee_id(record.employee_id);
  entry.set_business_date(record.business_date);
  entry.set_clock_in_at_ms(record.clock_in_at_ms);
  entry.set_clock_out_at_ms(record.clock_out_at_ms);
  entry.set_source(record.source);
  return entry;
}

resync::v1::ReplayItem ToProto(const ReplayItemRecord& record) {
  resync::v1::ReplayItem item;
  item.set_id(record.id);
  item.set_entity_type(record.entity_type);
  item.set_entity_id(record.entity_id);
  item.set_operation(record.operation);
  item.set_payload(record.payload);
  item.set_created_at_ms(record.created_at_ms);
  item.set_attempts(record.attempts);
  return item;
}

CheckRecord CheckFromProto(const resync::v1::Check& check) {
  CheckRecord record;
  record.id            = check.id();
  record.property_id   = check.property_id();
  record.business_date = check.business_date();
  record.status        = check.status() == resync::v1::CHECK_STATUS_UNSPECIFIED ? resync::v1::CHECK_STATUS_OPEN : check.status();
  for (const auto& item : check.line_items()) {
    LineItemRecord out;
    out.id               = item.id();
    out.menu_item_id     = item.menu_item_id();
    out.name             = item.name();
    out.quantity         = item.quantity();
    out.unit_price_cents = item.unit_price_cents();
    out.updated_at_ms    = item.updated_at_ms();
    record.line_items.push_back(std::move(out));
  }
  record.tax_cents        = check.tax_cents();
  record.tip_cents        = check.tip_cents();
  record.discount_cents   = check.discount_cents();
  record.guest_count      = check.guest_count();
  record.revision         = check.revision();
  record.conflict_state   = check.conflict_state();
  record.conflict_peer_id = check.conflict_peer_id();
  record.canonical        = check.canonical();
  record.displaced_holder = check.displaced_holder();
  record.updated_at_ms    = check.updated_at_ms();
  return record;
}

PaymentRecord PaymentFromProto(const resync::v1::Payment& payment) {
  PaymentRecord record;
  record.id            = payment.id();
  record.check_id      = payment.check_id();
  record.property_id   = payment.property_id();
  record.business_date = payment.business_date();
  record.tender_type   = payment.tender_type();
  record.amount_cents  = payment.amount_cents();
  record.tip_cents     = payment.tip_cents();
  record.created_at_ms = payment.created_at_ms();
  return record;
}

TimeEntryRecord TimeEntryFromProto(const resync::v1::TimeEntry& entry) {
  TimeEntryRecord record;
  record.id              = entry.id();
  record.property_id     = entry.property_id();
  record.employee_id     = entry.employee_id();
  record.business_date   = entry.business_date();
  record.clock_in_at_ms  = entry.clock_in_at_ms();
  record.clock_out_at_ms = entry.clock_out_at_ms();
  record.source          = entry.source();
  return record;
}

ReplayItemRecord ReplayItemFromProto(const resync::v1::ReplayItem& item) {
  ReplayItemRecord record;
  record.id            = item.id();
  record.entity_type   = item.entity_type();
  record.entity_id     = item.entity_id();
  record.operation     = item.operation();
  record.payload       = item.payload();
  record.created_at_ms = item.created_at_ms();
  record.attempts      = item.attempts();
  return record;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

} // namespace resync::db::model
