#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include "internal/db/api/db_errors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using resync::db::ErrorCode;
using resync::db::Result;
using resync::db::memory::MemoryRepository;
using resync::db::model::CheckRecord;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

CheckRecord MakeCheck(const std::string& id) {
  CheckRecord check;
  check.id            = id;
  check.property_id   = "downtown";
  check.business_date = "2026-01-05";
  check.revision      = 1;
  return check;
}

void TestIdsAreVersion7AndTimeOrdered() {
  const auto first = resync::util::NewId();
  assert(first.size() == 36);
  assert(first[8] == '-' && first[13] == '-' && first[18] == '-' && first[23] == '-');
  assert(first[14] == '7');
  assert(first[19] == '8' || first[19] == '9' || first[19] == 'a' || first[19] == 'b');

  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  const auto later = resync::util::NewId();
  assert(later.substr(0, 13) > first.substr(0, 13));

  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) ids.insert(resync::util::NewId());
  assert(ids.size() == 1000);
}

void TestFinishedTransactionRejectsSecondFinish() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  assert(tx->IsOpen());
  tx->Commit();
  assert(!tx->IsOpen());
  assert(Throws<resync::util::InvalidState>([&] { tx->Commit(); }));
  assert(Throws<resync::util::InvalidState>([&] { tx->Rollback(); }));
}

void TestAbandonedTransactionDiscardsWrites() {
  MemoryRepository repo;
  {
    auto       tx     = repo.Begin();
    const auto stored = repo.UpsertCheck(*tx, MakeCheck("c-1"));
    assert(stored);
  }

  auto tx = repo.Begin();
  assert(!repo.GetCheck(*tx, "c-1").has_value());
  tx->Commit();
}

void TestLosingWriterStaysOpenAfterConflict() {
  MemoryRepository repo;

  auto winner = repo.Begin();
  auto loser  = repo.Begin();
  auto a      = repo.UpsertCheck(*winner, MakeCheck("c-1"));
  auto b      = repo.UpsertCheck(*loser, MakeCheck("c-2"));
  assert(a && b);

  winner->Commit();
  assert(Throws<resync::util::LockConflict>([&] { loser->Commit(); }));
  assert(loser->IsOpen());
  loser->Rollback();

  auto verify = repo.Begin();
  assert(repo.GetCheck(*verify, "c-1").has_value());
  assert(!repo.GetCheck(*verify, "c-2").has_value());
  verify->Commit();
}

void TestDbErrorsMapToUtilErrors() {
  resync::db::ThrowIfDbError(Result::Ok(), "noop");

  assert(Throws<resync::util::AlreadyExists>(
      [] { resync::db::ThrowIfDbError(Result::Err(ErrorCode::AlreadyExists), "insert payment"); }));
  assert(Throws<resync::util::LockConflict>(
      [] { resync::db::ThrowIfDbError(Result::Err(ErrorCode::SerializationFailure), "apply check"); }));
  assert(Throws<resync::util::Unavailable>([] { resync::db::ThrowIfDbError(Result::Err(ErrorCode::Busy), "enqueue"); }));
  assert(Throws<resync::util::InvalidArgument>(
      [] { resync::db::ThrowIfDbError(Result::Err(ErrorCode::ConstraintViolation), "line item"); }));

  try {
    resync::db::ThrowIfDbError(Result::Err(ErrorCode::NotFound, "c-9"), "load check");
    assert(false);
  } catch (const resync::util::NotFound& e) {
    assert(std::string(e.what()) == "load check (not_found): c-9");
  }
}

} // namespace

int main() {
  TestIdsAreVersion7AndTimeOrdered();
  TestFinishedTransactionRejectsSecondFinish();
  TestAbandonedTransactionDiscardsWrites();
  TestLosingWriterStaysOpenAfterConflict();
  TestDbErrorsMapToUtilErrors();

  std::cout << "resync_unit_storage_primitives: pass\n";
  return 0;
}
