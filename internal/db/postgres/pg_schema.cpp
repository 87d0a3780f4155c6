#include "pg_schema.hpp"

namespace resync::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS properties (id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', timezone TEXT NOT NULL, rollover_time TEXT NOT NULL, rollover_mode SMALLINT NOT NULL, current_business_date TEXT NOT NULL DEFAULT '', allow_pm_rollover BOOLEAN NOT NULL DEFAULT FALSE, auto_clock_out BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("CREATE TABLE IF NOT EXISTS fiscal_periods (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, business_date TEXT NOT NULL, status SMALLINT NOT NULL, gross_sales BIGINT NOT NULL DEFAULT 0, net_sales BIGINT NOT NULL DEFAULT 0, tax_collected BIGINT NOT NULL DEFAULT 0, discounts_total BIGINT NOT NULL DEFAULT 0, tips_total BIGINT NOT NULL DEFAULT 0, payment_total BIGINT NOT NULL DEFAULT 0, check_count BIGINT NOT NULL DEFAULT 0, guest_count BIGINT NOT NULL DEFAULT 0, opened_at_ms BIGINT NOT NULL DEFAULT 0, closed_at_ms BIGINT NOT NULL DEFAULT 0, notes TEXT NOT NULL DEFAULT '', UNIQUE(property_id, business_date));");
  tx.exec("CREATE TABLE IF NOT EXISTS checks (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, business_date TEXT NOT NULL, status SMALLINT NOT NULL, tax_cents BIGINT NOT NULL DEFAULT 0, tip_cents BIGINT NOT NULL DEFAULT 0, discount_cents BIGINT NOT NULL DEFAULT 0, guest_count BIGINT NOT NULL DEFAULT 0, revision BIGINT NOT NULL DEFAULT 0, conflict_state SMALLINT NOT NULL DEFAULT 0, conflict_peer_id TEXT NOT NULL DEFAULT '', canonical BOOLEAN NOT NULL DEFAULT TRUE, displaced_holder TEXT NOT NULL DEFAULT '', updated_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS checks_by_date ON checks(property_id, business_date);");
  tx.exec("CREATE TABLE IF NOT EXISTS check_line_items (check_id TEXT NOT NULL REFERENCES checks(id) ON DELETE CASCADE, position INTEGER NOT NULL, id TEXT NOT NULL, menu_item_id TEXT NOT NULL DEFAULT '', name TEXT NOT NULL DEFAULT '', quantity BIGINT NOT NULL, unit_price_cents BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (check_id, id));");
  tx.exec("CREATE TABLE IF NOT EXISTS payments (id TEXT PRIMARY KEY, check_id TEXT NOT NULL, property_id TEXT NOT NULL, business_date TEXT NOT NULL, tender_type TEXT NOT NULL DEFAULT '', amount_cents BIGINT NOT NULL, tip_cents BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS payments_by_date ON payments(property_id, business_date);");
  tx.exec("CREATE TABLE IF NOT EXISTS time_entries (id TEXT PRIMARY KEY, property_id TEXT NOT NULL, employee_id TEXT NOT NULL, business_date TEXT NOT NULL, clock_in_at_ms BIGINT NOT NULL, clock_out_at_ms BIGINT NOT NULL DEFAULT 0, source TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE TABLE IF NOT EXISTS replay_queue (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, entity_type SMALLINT NOT NULL, entity_id TEXT NOT NULL, operation SMALLINT NOT NULL, payload TEXT NOT NULL, created_at_ms BIGINT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_attempt_ms BIGINT NOT NULL DEFAULT 0, status SMALLINT NOT NULL, error_message TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS replay_queue_by_status ON replay_queue(status, created_at_ms, seq);");
  tx.exec("CREATE INDEX IF NOT EXISTS replay_queue_by_entity ON replay_queue(entity_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS audit_log (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, action TEXT NOT NULL, target_type TEXT NOT NULL, target_id TEXT NOT NULL, actor_id TEXT NOT NULL DEFAULT '', details JSONB NOT NULL DEFAULT '{}'::jsonb, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO schema_migrations(version) VALUES(1) ON CONFLICT DO NOTHING;");
  tx.commit();
}

} // namespace resync::db::postgres
