#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace resync::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS properties (id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', timezone TEXT NOT NULL, rollover_time TEXT NOT NULL, rollover_mode INTEGER NOT NULL, current_business_date TEXT NOT NULL DEFAULT '', allow_pm_rollover INTEGER NOT NULL DEFAULT 0, auto_clock_out INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS fiscal_periods (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, business_date TEXT NOT NULL, status INTEGER NOT NULL, gross_sales INTEGER NOT NULL DEFAULT 0, net_sales INTEGER NOT NULL DEFAULT 0, tax_collected INTEGER NOT NULL DEFAULT 0, discounts_total INTEGER NOT NULL DEFAULT 0, tips_total INTEGER NOT NULL DEFAULT 0, payment_total INTEGER NOT NULL DEFAULT 0, check_count INTEGER NOT NULL DEFAULT 0, guest_count INTEGER NOT NULL DEFAULT 0, opened_at_ms INTEGER NOT NULL DEFAULT 0, closed_at_ms INTEGER NOT NULL DEFAULT 0, notes TEXT NOT NULL DEFAULT '', UNIQUE(property_id, business_date));",
      "CREATE TABLE IF NOT EXISTS checks (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, business_date TEXT NOT NULL, status INTEGER NOT NULL, tax_cents INTEGER NOT NULL DEFAULT 0, tip_cents INTEGER NOT NULL DEFAULT 0, discount_cents INTEGER NOT NULL DEFAULT 0, guest_count INTEGER NOT NULL DEFAULT 0, revision INTEGER NOT NULL DEFAULT 0, conflict_state INTEGER NOT NULL DEFAULT 0, conflict_peer_id TEXT NOT NULL DEFAULT '', canonical INTEGER NOT NULL DEFAULT 1, displaced_holder TEXT NOT NULL DEFAULT '', updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS checks_by_date ON checks(property_id, business_date);",
      "CREATE TABLE IF NOT EXISTS check_line_items (check_id TEXT NOT NULL REFERENCES checks(id) ON DELETE CASCADE, position INTEGER NOT NULL, id TEXT NOT NULL, menu_item_id TEXT NOT NULL DEFAULT '', name TEXT NOT NULL DEFAULT '', quantity INTEGER NOT NULL, unit_price_cents INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (check_id, id));",
      "CREATE TABLE IF NOT EXISTS payments (id TEXT PRIMARY KEY, check_id TEXT NOT NULL, property_id TEXT NOT NULL, business_date TEXT NOT NULL, tender_type TEXT NOT NULL DEFAULT '', amount_cents INTEGER NOT NULL, tip_cents INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS payments_by_date ON payments(property_id, business_date);",
      "CREATE TABLE IF NOT EXISTS time_entries (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, employee_id TEXT NOT NULL, business_date TEXT NOT NULL, clock_in_at_ms INTEGER NOT NULL, clock_out_at_ms INTEGER NOT NULL DEFAULT 0, source TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS replay_queue (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, entity_type INTEGER NOT NULL, entity_id TEXT NOT NULL, operation INTEGER NOT NULL, payload TEXT NOT NULL, created_at_ms INTEGER NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_attempt_ms INTEGER NOT NULL DEFAULT 0, status INTEGER NOT NULL, error_message TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS replay_queue_by_status ON replay_queue(status, created_at_ms, seq);",
      "CREATE INDEX IF NOT EXISTS replay_queue_by_entity ON replay_queue(entity_id);",
      "CREATE TABLE IF NOT EXISTS audit_log (id TEXT PRIMARY KEY, action TEXT NOT NULL, target_type TEXT NOT NULL, target_id TEXT NOT NULL, actor_id TEXT NOT NULL DEFAULT '', details TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
}

} // namespace resync::db::sqlite
