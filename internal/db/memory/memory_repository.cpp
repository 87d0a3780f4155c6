#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace resync::db::memory {

namespace {

bool AwaitingSync(const model::ReplayItemRecord& r) {
  return r.status == resync::v1::REPLAY_STATUS_PENDING || r.status == resync::v1::REPLAY_STATUS_FAILED;
}

bool ReplayOrder(const model::ReplayItemRecord& a, const model::ReplayItemRecord& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.seq < b.seq;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Properties
// ------------------------------------------------------------------

Result MemoryRepository::UpsertProperty(Transaction& t, const model::PropertyRecord& r) {
  TX(t).Mutable().properties[r.id] = r;
  return Result::Ok();
}

std::optional<model::PropertyRecord> MemoryRepository::GetProperty(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.properties.find(id);
  if (it == s.properties.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PropertyRecord> MemoryRepository::ListProperties(Transaction& t) {
  std::vector<model::PropertyRecord> out;
  for (const auto& [_, r] : TX(t).View().properties) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Fiscal periods
// ------------------------------------------------------------------

Result MemoryRepository::InsertFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.fiscal_periods.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  for (const auto& [_, existing] : s.fiscal_periods) {
    if (existing.property_id == r.property_id && existing.business_date == r.business_date) {
      return Result::Err(ErrorCode::AlreadyExists, "fiscal period exists for " + r.business_date);
    }
  }
  s.fiscal_periods[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.fiscal_periods.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.fiscal_periods[r.id] = r;
  return Result::Ok();
}

std::optional<model::FiscalPeriodRecord> MemoryRepository::GetFiscalPeriod(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.fiscal_periods.find(id);
  if (it == s.fiscal_periods.end()) return std::nullopt;
  return it->second;
}

std::optional<model::FiscalPeriodRecord> MemoryRepository::GetFiscalPeriodByDate(Transaction& t, const std::string& property_id,
                                                                                  const std::string& business_date) {
  for (const auto& [_, r] : TX(t).View().fiscal_periods) {
    if (r.property_id == property_id && r.business_date == business_date) return r;
  }
  return std::nullopt;
}

std::vector<model::FiscalPeriodRecord> MemoryRepository::ListFiscalPeriods(Transaction& t, const std::string& property_id) {
  std::vector<model::FiscalPeriodRecord> out;
  for (const auto& [_, r] : TX(t).View().fiscal_periods)
    if (r.property_id == property_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.business_date < b.business_date; });
  return out;
}

// ------------------------------------------------------------------
// Checks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCheck(Transaction& t, const model::CheckRecord& r) {
  TX(t).Mutable().checks[r.id] = r;
  return Result::Ok();
}

std::optional<model::CheckRecord> MemoryRepository::GetCheck(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.checks.find(id);
  if (it == s.checks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CheckRecord> MemoryRepository::ListChecks(Transaction& t, const std::string& property_id, const std::string& business_date) {
  std::vector<model::CheckRecord> out;
  for (const auto& [_, r] : TX(t).View().checks)
    if (r.property_id == property_id && r.business_date == business_date) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

std::vector<model::CheckRecord> MemoryRepository::ListConflictedChecks(Transaction& t, const std::string& holder_id) {
  std::vector<model::CheckRecord> out;
  for (const auto& [_, r] : TX(t).View().checks)
    if (r.conflict_state == resync::v1::CONFLICT_STATE_PENDING && r.displaced_holder == holder_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::DeleteCheck(Transaction& t, const std::string& id) {
  TX(t).Mutable().checks.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPayment(Transaction& t, const model::PaymentRecord& r) {
  TX(t).Mutable().payments[r.id] = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.payments.find(id);
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PaymentRecord> MemoryRepository::ListPayments(Transaction& t, const std::string& property_id, const std::string& business_date) {
  std::vector<model::PaymentRecord> out;
  for (const auto& [_, r] : TX(t).View().payments)
    if (r.property_id == property_id && r.business_date == business_date) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::DeletePayment(Transaction& t, const std::string& id) {
  TX(t).Mutable().payments.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Time entries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTimeEntry(Transaction& t, const model::TimeEntryRecord& r) {
  TX(t).Mutable().time_entries[r.id] = r;
  return Result::Ok();
}

std::optional<model::TimeEntryRecord> MemoryRepository::GetTimeEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.time_entries.find(id);
  if (it == s.time_entries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TimeEntryRecord> MemoryRepository::ListOpenTimeEntries(Transaction& t, const std::string& property_id) {
  std::vector<model::TimeEntryRecord> out;
  for (const auto& [_, r] : TX(t).View().time_entries)
    if (r.property_id == property_id && r.clock_out_at_ms == 0) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.clock_in_at_ms != b.clock_in_at_ms) return a.clock_in_at_ms < b.clock_in_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::DeleteTimeEntry(Transaction& t, const std::string& id) {
  TX(t).Mutable().time_entries.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Replay queue
// ------------------------------------------------------------------

Result MemoryRepository::EnqueueReplay(Transaction& t, model::ReplayItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.replay.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  r.seq         = s.next_replay_seq++;
  s.replay[r.id] = r;
  return Result::Ok();
}

std::vector<model::ReplayItemRecord> MemoryRepository::ListReplayBatch(Transaction& t, uint32_t limit) {
  std::vector<model::ReplayItemRecord> out;
  for (const auto& [_, r] : TX(t).View().replay)
    if (AwaitingSync(r)) out.push_back(r);
  std::sort(out.begin(), out.end(), ReplayOrder);
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ReplayItemRecord> MemoryRepository::ListReplayHeads(Transaction& t, uint32_t limit) {
  std::unordered_map<std::string, const model::ReplayItemRecord*> oldest;
  for (const auto& [_, r] : TX(t).View().replay) {
    if (r.status == resync::v1::REPLAY_STATUS_COMPLETED) continue;
    auto& head = oldest[r.entity_id];
    if (!head || ReplayOrder(r, *head)) head = &r;
  }

  std::vector<model::ReplayItemRecord> out;
  for (const auto& [_, head] : oldest)
    if (AwaitingSync(*head)) out.push_back(*head);
  std::sort(out.begin(), out.end(), [](const model::ReplayItemRecord& a, const model::ReplayItemRecord& b) {
    const bool a_failed = a.status == resync::v1::REPLAY_STATUS_FAILED;
    const bool b_failed = b.status == resync::v1::REPLAY_STATUS_FAILED;
    if (a_failed != b_failed) return b_failed;
    if (a_failed && a.last_attempt_ms != b.last_attempt_ms) return a.last_attempt_ms < b.last_attempt_ms;
    return ReplayOrder(a, b);
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ReplayItemRecord> MemoryRepository::ListReplayForEntity(Transaction& t, const std::string& entity_id) {
  std::vector<model::ReplayItemRecord> out;
  for (const auto& [_, r] : TX(t).View().replay)
    if (r.entity_id == entity_id) out.push_back(r);
  std::sort(out.begin(), out.end(), ReplayOrder);
  return out;
}

Result MemoryRepository::UpdateReplay(Transaction& t, const model::ReplayItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.replay.find(r.id);
  if (it == s.replay.end()) return Result::Err(ErrorCode::NotFound);
  const auto seq = it->second.seq;
  it->second     = r;
  it->second.seq = seq;
  return Result::Ok();
}

Result MemoryRepository::DeleteReplay(Transaction& t, const std::string& id) {
  TX(t).Mutable().replay.erase(id);
  return Result::Ok();
}

uint64_t MemoryRepository::ResetSyncingReplay(Transaction& t) {
  uint64_t touched = 0;
  for (auto& [_, r] : TX(t).Mutable().replay) {
    if (r.status == resync::v1::REPLAY_STATUS_SYNCING) {
      r.status = resync::v1::REPLAY_STATUS_PENDING;
      ++touched;
    }
  }
  return touched;
}

ReplayCounts MemoryRepository::CountReplay(Transaction& t) {
  ReplayCounts counts;
  for (const auto& [_, r] : TX(t).View().replay) {
    if (r.status == resync::v1::REPLAY_STATUS_COMPLETED) continue;
    ++counts.backlog;
    if (r.status == resync::v1::REPLAY_STATUS_FAILED) ++counts.failed;
    if (counts.oldest_created_ms == 0 || r.created_at_ms < counts.oldest_created_ms) counts.oldest_created_ms = r.created_at_ms;
  }
  return counts;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).Mutable().audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const std::string& target_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& r : TX(t).View().audit)
    if (r.target_id == target_id) out.push_back(r);
  return out;
}

} // namespace resync::db::memory
