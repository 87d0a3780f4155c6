#include "local_writer.hpp"

#include <stdexcept>
#include <unordered_map>

#include "internal/businessdate/business_date.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/model/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resync::replay {

using namespace resync::v1;

namespace {

bool SameContent(const db::model::LineItemRecord& a, const db::model::LineItemRecord& b) {
  return a.menu_item_id == b.menu_item_id && a.name == b.name && a.quantity == b.quantity && a.unit_price_cents == b.unit_price_cents;
}

} // namespace

LocalWriter::LocalWriter(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReplayQueue> queue, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), queue_(std::move(queue)), clock_(std::move(clock)) {
  if (!repository_ || !queue_ || !clock_) {
    throw std::invalid_argument("LocalWriter requires repository, replay queue and clock");
  }
}

std::string LocalWriter::BusinessDateFor(db::Transaction& tx, const std::string& property_id, util::TimePoint now) {
  auto property = repository_->GetProperty(tx, property_id);
  if (!property) throw util::NotFound("property " + property_id + " not found");
  return businessdate::ResolveBusinessDate(now, *property);
}

SavedCheck LocalWriter::SaveCheck(Check check) {
  if (check.property_id().empty()) throw util::InvalidArgument("check property_id is required");
  if (check.id().empty()) check.set_id(util::NewId());

  const auto now    = clock_->Now();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx     = repository_->Begin();
  auto stored = repository_->GetCheck(*tx, check.id());

  if (stored && check.revision() != 0 && check.revision() != stored->revision) {
    throw util::LockConflict("check " + check.id() + " changed since revision " + std::to_string(check.revision()));
  }

  auto record = db::model::CheckFromProto(check);
  if (record.business_date.empty()) {
    record.business_date = stored ? stored->business_date : BusinessDateFor(*tx, record.property_id, now);
  }

  std::unordered_map<std::string, const db::model::LineItemRecord*> previous;
  if (stored) {
    for (const auto& item : stored->line_items) previous.emplace(item.id, &item);
  }
  for (auto& item : record.line_items) {
    if (item.id.empty()) item.id = util::NewId();
    auto it = previous.find(item.id);
    if (it == previous.end() || !SameContent(*it->second, item)) {
      item.updated_at_ms = now_ms;
    } else {
      item.updated_at_ms = it->second->updated_at_ms;
    }
  }

  if (stored) {
    record.conflict_state   = stored->conflict_state;
    record.conflict_peer_id = stored->conflict_peer_id;
    record.canonical        = stored->canonical;
    record.displaced_holder = stored->displaced_holder;
  }
  record.revision      = stored ? stored->revision + 1 : 1;
  record.updated_at_ms = now_ms;

  db::ThrowIfDbError(repository_->UpsertCheck(*tx, record), "save check");

  SavedCheck saved;
  saved.revision  = record.revision;
  saved.replay_id = queue_->Enqueue(*tx, ENTITY_TYPE_CHECK, record.id, stored ? REPLAY_OPERATION_UPDATE : REPLAY_OPERATION_CREATE,
                                    db::model::ToJson(db::model::ToProto(record)));
  tx->Commit();
  return saved;
}

std::string LocalWriter::RecordPayment(Payment payment) {
  if (payment.check_id().empty()) throw util::InvalidArgument("payment check_id is required");
  if (payment.property_id().empty()) throw util::InvalidArgument("payment property_id is required");
  if (payment.id().empty()) payment.set_id(util::NewId());

  const auto now = clock_->Now();
  if (payment.created_at_ms() == 0) payment.set_created_at_ms(util::ToUnixMillis(now));

  auto tx = repository_->Begin();
  if (payment.business_date().empty()) payment.set_business_date(BusinessDateFor(*tx, payment.property_id(), now));

  const bool exists = repository_->GetPayment(*tx, payment.id()).has_value();
  db::ThrowIfDbError(repository_->UpsertPayment(*tx, db::model::PaymentFromProto(payment)), "record payment");

  auto replay_id = queue_->Enqueue(*tx, ENTITY_TYPE_PAYMENT, payment.id(), exists ? REPLAY_OPERATION_UPDATE : REPLAY_OPERATION_CREATE,
                                   db::model::ToJson(payment));
  tx->Commit();
  return replay_id;
}

std::string LocalWriter::RecordTimeEntry(TimeEntry entry) {
  if (entry.employee_id().empty()) throw util::InvalidArgument("time entry employee_id is required");
  if (entry.property_id().empty()) throw util::InvalidArgument("time entry property_id is required");
  if (entry.id().empty()) entry.set_id(util::NewId());
  if (entry.source().empty()) entry.set_source("terminal");

  const auto now = clock_->Now();
  if (entry.clock_in_at_ms() == 0) entry.set_clock_in_at_ms(util::ToUnixMillis(now));
  if (entry.clock_out_at_ms() != 0 && entry.clock_out_at_ms() < entry.clock_in_at_ms()) {
    throw util::InvalidArgument("clock-out precedes clock-in");
  }

  auto tx = repository_->Begin();
  if (entry.business_date().empty()) {
    entry.set_business_date(BusinessDateFor(*tx, entry.property_id(), util::FromUnixMillis(entry.clock_in_at_ms())));
  }

  const bool exists = repository_->GetTimeEntry(*tx, entry.id()).has_value();
  db::ThrowIfDbError(repository_->UpsertTimeEntry(*tx, db::model::TimeEntryFromProto(entry)), "record time entry");

  auto replay_id = queue_->Enqueue(*tx, ENTITY_TYPE_TIME_ENTRY, entry.id(), exists ? REPLAY_OPERATION_UPDATE : REPLAY_OPERATION_CREATE,
                                   db::model::ToJson(entry));
  tx->Commit();
  return replay_id;
}

} // namespace resync::replay
