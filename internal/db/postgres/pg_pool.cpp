#include "pg_pool.hpp"

namespace resync::db::postgres {

PgPool::Lease::Lease(std::shared_ptr<PgPool> pool, std::unique_ptr<Slot> slot) : pool_(std::move(pool)), slot_(std::move(slot)) {
}

PgPool::Lease::~Lease() {
  if (pool_ && slot_) {
    pool_->Return(std::move(slot_));
  }
}

pqxx::connection& PgPool::Lease::Prepared() {
  if (!slot_->prepared) {
    PrepareStatements(*slot_->conn);
    slot_->prepared = true;
  }
  return *slot_->conn;
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections > 0 ? max_connections : 1) {
}

PgPool::Lease PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

  if (!idle_.empty()) {
    auto slot = std::move(idle_.back());
    idle_.pop_back();
    return Lease(shared_from_this(), std::move(slot));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();
  try {
    auto slot  = std::make_unique<Slot>();
    slot->conn = std::make_unique<pqxx::connection>(conninfo_);
    return Lease(shared_from_this(), std::move(slot));
  } catch (...) {
    lock.lock();
    --open_;
    returned_.notify_one();
    throw;
  }
}

void PgPool::Return(std::unique_ptr<Slot> slot) {
  {
    std::lock_guard lock(mutex_);
    if (slot->conn && slot->conn->is_open()) {
      idle_.push_back(std::move(slot));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // Issued on every sync tick.
  conn.prepare("replay_batch",
               "SELECT id,seq,entity_type,entity_id,operation,payload,created_at_ms,attempts,last_attempt_ms,status,error_message "
               "FROM replay_queue WHERE status IN ($1,$2) ORDER BY created_at_ms ASC, seq ASC LIMIT $3");
  conn.prepare("replay_heads",
               "SELECT r.id,r.seq,r.entity_type,r.entity_id,r.operation,r.payload,r.created_at_ms,r.attempts,r.last_attempt_ms,r.status,"
               "r.error_message FROM replay_queue r WHERE r.status IN ($1,$2) AND NOT EXISTS ("
               "SELECT 1 FROM replay_queue o WHERE o.entity_id = r.entity_id AND o.status <> $3 AND "
               "(o.created_at_ms, o.seq) < (r.created_at_ms, r.seq)) "
               "ORDER BY (r.status = $2) ASC, CASE WHEN r.status = $2 THEN r.last_attempt_ms ELSE 0 END ASC, "
               "r.created_at_ms ASC, r.seq ASC LIMIT $4");
  conn.prepare("replay_update",
               "UPDATE replay_queue SET payload=$2,attempts=$3,last_attempt_ms=$4,status=$5,error_message=$6 WHERE id=$1");
  conn.prepare("replay_delete", "DELETE FROM replay_queue WHERE id=$1");

  // Issued by every lock, override and apply.
  conn.prepare("get_check",
               "SELECT id,property_id,business_date,status,tax_cents,tip_cents,discount_cents,guest_count,revision,"
               "conflict_state,conflict_peer_id,canonical,displaced_holder,updated_at_ms FROM checks WHERE id=$1");
  conn.prepare("get_line_items",
               "SELECT id,menu_item_id,name,quantity,unit_price_cents,updated_at_ms "
               "FROM check_line_items WHERE check_id=$1 ORDER BY position ASC");
}

} // namespace resync::db::postgres
