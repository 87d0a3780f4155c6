#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace resync::db::sqlite {

using resync::db::ErrorCode;
using resync::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

static Result ExecById(sqlite3* db, const char* sql, const std::string& id) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE) return Result::Ok();
    return Result::Err(rc == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Properties
// ------------------------------------------------------------------

static constexpr const char* kPropertyColumns =
    "id,name,timezone,rollover_time,rollover_mode,current_business_date,allow_pm_rollover,auto_clock_out";

static model::PropertyRecord ReadProperty(sqlite3_stmt* st) {
    model::PropertyRecord r;
    r.id = ColText(st, 0);
    r.name = ColText(st, 1);
    r.timezone = ColText(st, 2);
    r.rollover_time = ColText(st, 3);
    r.rollover_mode = static_cast<resync::v1::RolloverMode>(ColI32(st, 4));
    r.current_business_date = ColText(st, 5);
    r.allow_pm_rollover = ColI32(st, 6) != 0;
    r.auto_clock_out = ColI32(st, 7) != 0;
    return r;
}

Result SqliteRepository::UpsertProperty(Transaction& t, const model::PropertyRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO properties(id,name,timezone,rollover_time,rollover_mode,current_business_date,"
        "allow_pm_rollover,auto_clock_out) VALUES(?,?,?,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET name=excluded.name, timezone=excluded.timezone, "
        "rollover_time=excluded.rollover_time, rollover_mode=excluded.rollover_mode, "
        "current_business_date=excluded.current_business_date, allow_pm_rollover=excluded.allow_pm_rollover, "
        "auto_clock_out=excluded.auto_clock_out;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.name);
    BindText(st, 3, r.timezone);
    BindText(st, 4, r.rollover_time);
    BindI32(st, 5, static_cast<int>(r.rollover_mode));
    BindText(st, 6, r.current_business_date);
    BindI32(st, 7, r.allow_pm_rollover ? 1 : 0);
    BindI32(st, 8, r.auto_clock_out ? 1 : 0);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::PropertyRecord>
SqliteRepository::GetProperty(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPropertyColumns + " FROM properties WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadProperty(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::PropertyRecord> SqliteRepository::ListProperties(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPropertyColumns + " FROM properties ORDER BY id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    std::vector<model::PropertyRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadProperty(st));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Fiscal periods
// ------------------------------------------------------------------

static constexpr const char* kFiscalColumns =
    "id,property_id,business_date,status,gross_sales,net_sales,tax_collected,discounts_total,"
    "tips_total,payment_total,check_count,guest_count,opened_at_ms,closed_at_ms,notes";

static model::FiscalPeriodRecord ReadFiscalPeriod(sqlite3_stmt* st) {
    model::FiscalPeriodRecord r;
    r.id = ColText(st, 0);
    r.property_id = ColText(st, 1);
    r.business_date = ColText(st, 2);
    r.status = static_cast<resync::v1::FiscalPeriodStatus>(ColI32(st, 3));
    r.totals.gross_sales = ColI64(st, 4);
    r.totals.net_sales = ColI64(st, 5);
    r.totals.tax_collected = ColI64(st, 6);
    r.totals.discounts_total = ColI64(st, 7);
    r.totals.tips_total = ColI64(st, 8);
    r.totals.payment_total = ColI64(st, 9);
    r.totals.check_count = ColI64(st, 10);
    r.totals.guest_count = ColI64(st, 11);
    r.opened_at_ms = ColU64(st, 12);
    r.closed_at_ms = ColU64(st, 13);
    r.notes = ColText(st, 14);
    return r;
}

static void BindFiscalValues(sqlite3_stmt* st, int first, const model::FiscalPeriodRecord& r) {
    BindI32(st, first, static_cast<int>(r.status));
    BindI64(st, first + 1, r.totals.gross_sales);
    BindI64(st, first + 2, r.totals.net_sales);
    BindI64(st, first + 3, r.totals.tax_collected);
    BindI64(st, first + 4, r.totals.discounts_total);
    BindI64(st, first + 5, r.totals.tips_total);
    BindI64(st, first + 6, r.totals.payment_total);
    BindI64(st, first + 7, r.totals.check_count);
    BindI64(st, first + 8, r.totals.guest_count);
    BindU64(st, first + 9, r.opened_at_ms);
    BindU64(st, first + 10, r.closed_at_ms);
    BindText(st, first + 11, r.notes);
}

Result SqliteRepository::InsertFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO fiscal_periods(id,property_id,business_date,status,gross_sales,net_sales,tax_collected,"
        "discounts_total,tips_total,payment_total,check_count,guest_count,opened_at_ms,closed_at_ms,notes) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.property_id);
    BindText(st, 3, r.business_date);
    BindFiscalValues(st, 4, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::UpdateFiscalPeriod(Transaction& t, const model::FiscalPeriodRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE fiscal_periods SET status=?,gross_sales=?,net_sales=?,tax_collected=?,discounts_total=?,"
        "tips_total=?,payment_total=?,check_count=?,guest_count=?,opened_at_ms=?,closed_at_ms=?,notes=? "
        "WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindFiscalValues(st, 1, r);
    BindText(st, 13, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "fiscal period not found");
    return Translate(db, rc);
}

std::optional<model::FiscalPeriodRecord>
SqliteRepository::GetFiscalPeriod(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kFiscalColumns + " FROM fiscal_periods WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadFiscalPeriod(st);
    sqlite3_finalize(st);
    return r;
}

std::optional<model::FiscalPeriodRecord> SqliteRepository::GetFiscalPeriodByDate(
    Transaction& t, const std::string& property_id, const std::string& business_date) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kFiscalColumns +
                            " FROM fiscal_periods WHERE property_id=? AND business_date=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, property_id);
    BindText(st, 2, business_date);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadFiscalPeriod(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::FiscalPeriodRecord>
SqliteRepository::ListFiscalPeriods(Transaction& t, const std::string& property_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kFiscalColumns +
                            " FROM fiscal_periods WHERE property_id=? ORDER BY business_date ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, property_id);

    std::vector<model::FiscalPeriodRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadFiscalPeriod(st));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Checks
// ------------------------------------------------------------------

static constexpr const char* kCheckColumns =
    "id,property_id,business_date,status,tax_cents,tip_cents,discount_cents,guest_count,revision,"
    "conflict_state,conflict_peer_id,canonical,displaced_holder,updated_at_ms";

Result SqliteRepository::UpsertCheck(Transaction& t, const model::CheckRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO checks(id,property_id,business_date,status,tax_cents,tip_cents,discount_cents,guest_count,"
        "revision,conflict_state,conflict_peer_id,canonical,displaced_holder,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET property_id=excluded.property_id, business_date=excluded.business_date, "
        "status=excluded.status, tax_cents=excluded.tax_cents, tip_cents=excluded.tip_cents, "
        "discount_cents=excluded.discount_cents, guest_count=excluded.guest_count, revision=excluded.revision, "
        "conflict_state=excluded.conflict_state, conflict_peer_id=excluded.conflict_peer_id, "
        "canonical=excluded.canonical, displaced_holder=excluded.displaced_holder, "
        "updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.property_id);
    BindText(st, 3, r.business_date);
    BindI32(st, 4, static_cast<int>(r.status));
    BindI64(st, 5, r.tax_cents);
    BindI64(st, 6, r.tip_cents);
    BindI64(st, 7, r.discount_cents);
    BindI64(st, 8, r.guest_count);
    BindU64(st, 9, r.revision);
    BindI32(st, 10, static_cast<int>(r.conflict_state));
    BindText(st, 11, r.conflict_peer_id);
    BindI32(st, 12, r.canonical ? 1 : 0);
    BindText(st, 13, r.displaced_holder);
    BindU64(st, 14, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    auto cleared = ExecById(db, "DELETE FROM check_line_items WHERE check_id=?;", r.id);
    if (!cleared) return cleared;

    const char* ins_sql =
        "INSERT INTO check_line_items(check_id,position,id,menu_item_id,name,quantity,unit_price_cents,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    sqlite3_stmt* ins_st = nullptr;
    if (sqlite3_prepare_v2(db, ins_sql, -1, &ins_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int position = 0;
    for (const auto& item : r.line_items) {
        sqlite3_reset(ins_st);
        sqlite3_clear_bindings(ins_st);

        BindText(ins_st, 1, r.id);
        BindI32(ins_st, 2, position++);
        BindText(ins_st, 3, item.id);
        BindText(ins_st, 4, item.menu_item_id);
        BindText(ins_st, 5, item.name);
        BindI64(ins_st, 6, item.quantity);
        BindI64(ins_st, 7, item.unit_price_cents);
        BindU64(ins_st, 8, item.updated_at_ms);

        int item_rc = sqlite3_step(ins_st);
        if (item_rc != SQLITE_DONE) {
            sqlite3_finalize(ins_st);
            return Translate(db, item_rc);
        }
    }

    sqlite3_finalize(ins_st);
    return Result::Ok();
}

std::vector<model::LineItemRecord>
SqliteRepository::LoadLineItems(sqlite3* db, const std::string& check_id) {
    const char* sql =
        "SELECT id,menu_item_id,name,quantity,unit_price_cents,updated_at_ms "
        "FROM check_line_items WHERE check_id=? ORDER BY position ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, check_id);

    std::vector<model::LineItemRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::LineItemRecord item;
        item.id = ColText(st, 0);
        item.menu_item_id = ColText(st, 1);
        item.name = ColText(st, 2);
        item.quantity = ColI64(st, 3);
        item.unit_price_cents = ColI64(st, 4);
        item.updated_at_ms = ColU64(st, 5);
        out.push_back(std::move(item));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::CheckRecord> SqliteRepository::QueryChecks(
    sqlite3* db, const std::string& where, const std::vector<std::string>& params) {
    const std::string sql = std::string("SELECT ") + kCheckColumns + " FROM checks WHERE " + where + ";";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    for (size_t i = 0; i < params.size(); ++i) {
        BindText(st, static_cast<int>(i + 1), params[i]);
    }

    std::vector<model::CheckRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::CheckRecord r;
        r.id = ColText(st, 0);
        r.property_id = ColText(st, 1);
        r.business_date = ColText(st, 2);
        r.status = static_cast<resync::v1::CheckStatus>(ColI32(st, 3));
        r.tax_cents = ColI64(st, 4);
        r.tip_cents = ColI64(st, 5);
        r.discount_cents = ColI64(st, 6);
        r.guest_count = ColI64(st, 7);
        r.revision = ColU64(st, 8);
        r.conflict_state = static_cast<resync::v1::ConflictState>(ColI32(st, 9));
        r.conflict_peer_id = ColText(st, 10);
        r.canonical = ColI32(st, 11) != 0;
        r.displaced_holder = ColText(st, 12);
        r.updated_at_ms = ColU64(st, 13);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);

    // line items are loaded after the outer statement is finalized
    for (auto& r : out) {
        r.line_items = LoadLineItems(db, r.id);
    }
    return out;
}

std::optional<model::CheckRecord>
SqliteRepository::GetCheck(Transaction& t, const std::string& id) {
    auto rows = QueryChecks(TX(t).Handle(), "id=?", {id});
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<model::CheckRecord> SqliteRepository::ListChecks(
    Transaction& t, const std::string& property_id, const std::string& business_date) {
    return QueryChecks(TX(t).Handle(), "property_id=? AND business_date=? ORDER BY id", {property_id, business_date});
}

std::vector<model::CheckRecord>
SqliteRepository::ListConflictedChecks(Transaction& t, const std::string& holder_id) {
    return QueryChecks(TX(t).Handle(),
                       "conflict_state=" + std::to_string(static_cast<int>(resync::v1::CONFLICT_STATE_PENDING)) +
                           " AND displaced_holder=? ORDER BY id",
                       {holder_id});
}

Result SqliteRepository::DeleteCheck(Transaction& t, const std::string& id) {
    return ExecById(TX(t).Handle(), "DELETE FROM checks WHERE id=?;", id);
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

static constexpr const char* kPaymentColumns =
    "id,check_id,property_id,business_date,tender_type,amount_cents,tip_cents,created_at_ms";

static model::PaymentRecord ReadPayment(sqlite3_stmt* st) {
    model::PaymentRecord r;
    r.id = ColText(st, 0);
    r.check_id = ColText(st, 1);
    r.property_id = ColText(st, 2);
    r.business_date = ColText(st, 3);
    r.tender_type = ColText(st, 4);
    r.amount_cents = ColI64(st, 5);
    r.tip_cents = ColI64(st, 6);
    r.created_at_ms = ColU64(st, 7);
    return r;
}

Result SqliteRepository::UpsertPayment(Transaction& t, const model::PaymentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO payments(id,check_id,property_id,business_date,tender_type,amount_cents,tip_cents,created_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET check_id=excluded.check_id, property_id=excluded.property_id, "
        "business_date=excluded.business_date, tender_type=excluded.tender_type, "
        "amount_cents=excluded.amount_cents, tip_cents=excluded.tip_cents, created_at_ms=excluded.created_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.check_id);
    BindText(st, 3, r.property_id);
    BindText(st, 4, r.business_date);
    BindText(st, 5, r.tender_type);
    BindI64(st, 6, r.amount_cents);
    BindI64(st, 7, r.tip_cents);
    BindU64(st, 8, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::PaymentRecord>
SqliteRepository::GetPayment(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPaymentColumns + " FROM payments WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadPayment(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::PaymentRecord> SqliteRepository::ListPayments(
    Transaction& t, const std::string& property_id, const std::string& business_date) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPaymentColumns +
                            " FROM payments WHERE property_id=? AND business_date=? ORDER BY id;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, property_id);
    BindText(st, 2, business_date);

    std::vector<model::PaymentRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadPayment(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeletePayment(Transaction& t, const std::string& id) {
    return ExecById(TX(t).Handle(), "DELETE FROM payments WHERE id=?;", id);
}

// ------------------------------------------------------------------
// Time entries
// ------------------------------------------------------------------

static constexpr const char* kTimeEntryColumns =
    "id,property_id,employee_id,business_date,clock_in_at_ms,clock_out_at_ms,source";

static model::TimeEntryRecord ReadTimeEntry(sqlite3_stmt* st) {
    model::TimeEntryRecord r;
    r.id = ColText(st, 0);
    r.property_id = ColText(st, 1);
    r.employee_id = ColText(st, 2);
    r.business_date = ColText(st, 3);
    r.clock_in_at_ms = ColU64(st, 4);
    r.clock_out_at_ms = ColU64(st, 5);
    r.source = ColText(st, 6);
    return r;
}

Result SqliteRepository::UpsertTimeEntry(Transaction& t, const model::TimeEntryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO time_entries(id,property_id,employee_id,business_date,clock_in_at_ms,clock_out_at_ms,source) "
        "VALUES(?,?,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET property_id=excluded.property_id, employee_id=excluded.employee_id, "
        "business_date=excluded.business_date, clock_in_at_ms=excluded.clock_in_at_ms, "
        "clock_out_at_ms=excluded.clock_out_at_ms, source=excluded.source;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.property_id);
    BindText(st, 3, r.employee_id);
    BindText(st, 4, r.business_date);
    BindU64(st, 5, r.clock_in_at_ms);
    BindU64(st, 6, r.clock_out_at_ms);
    BindText(st, 7, r.source);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::TimeEntryRecord>
SqliteRepository::GetTimeEntry(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTimeEntryColumns + " FROM time_entries WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadTimeEntry(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::TimeEntryRecord>
SqliteRepository::ListOpenTimeEntries(Transaction& t, const std::string& property_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kTimeEntryColumns +
                            " FROM time_entries WHERE property_id=? AND clock_out_at_ms=0 "
                            "ORDER BY clock_in_at_ms ASC, id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, property_id);

    std::vector<model::TimeEntryRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadTimeEntry(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteTimeEntry(Transaction& t, const std::string& id) {
    return ExecById(TX(t).Handle(), "DELETE FROM time_entries WHERE id=?;", id);
}

// ------------------------------------------------------------------
// Replay queue
// ------------------------------------------------------------------

static constexpr const char* kReplayColumns =
    "id,seq,entity_type,entity_id,operation,payload,created_at_ms,attempts,last_attempt_ms,status,error_message";

static model::ReplayItemRecord ReadReplay(sqlite3_stmt* st) {
    model::ReplayItemRecord r;
    r.id = ColText(st, 0);
    r.seq = ColU64(st, 1);
    r.entity_type = static_cast<resync::v1::EntityType>(ColI32(st, 2));
    r.entity_id = ColText(st, 3);
    r.operation = static_cast<resync::v1::ReplayOperation>(ColI32(st, 4));
    r.payload = ColText(st, 5);
    r.created_at_ms = ColU64(st, 6);
    r.attempts = static_cast<uint32_t>(ColU64(st, 7));
    r.last_attempt_ms = ColU64(st, 8);
    r.status = static_cast<resync::v1::ReplayStatus>(ColI32(st, 9));
    r.error_message = ColText(st, 10);
    return r;
}

Result SqliteRepository::EnqueueReplay(Transaction& t, model::ReplayItemRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO replay_queue(id,entity_type,entity_id,operation,payload,created_at_ms,attempts,"
        "last_attempt_ms,status,error_message) VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindI32(st, 2, static_cast<int>(r.entity_type));
    BindText(st, 3, r.entity_id);
    BindI32(st, 4, static_cast<int>(r.operation));
    BindText(st, 5, r.payload);
    BindU64(st, 6, r.created_at_ms);
    BindU64(st, 7, r.attempts);
    BindU64(st, 8, r.last_attempt_ms);
    BindI32(st, 9, static_cast<int>(r.status));
    BindText(st, 10, r.error_message);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::ReplayItemRecord> SqliteRepository::ListReplayBatch(Transaction& t, uint32_t limit) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kReplayColumns +
                            " FROM replay_queue WHERE status IN (?,?) ORDER BY created_at_ms ASC, seq ASC LIMIT ?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindI32(st, 1, static_cast<int>(resync::v1::REPLAY_STATUS_PENDING));
    BindI32(st, 2, static_cast<int>(resync::v1::REPLAY_STATUS_FAILED));
    BindU64(st, 3, limit);

    std::vector<model::ReplayItemRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadReplay(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::ReplayItemRecord> SqliteRepository::ListReplayHeads(Transaction& t, uint32_t limit) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("SELECT ") + kReplayColumns +
        " FROM replay_queue r WHERE status IN (?1,?2) AND NOT EXISTS ("
        "SELECT 1 FROM replay_queue o WHERE o.entity_id = r.entity_id AND o.status <> ?3 AND "
        "(o.created_at_ms < r.created_at_ms OR (o.created_at_ms = r.created_at_ms AND o.seq < r.seq))) "
        "ORDER BY (status = ?2) ASC, CASE WHEN status = ?2 THEN last_attempt_ms ELSE 0 END ASC, created_at_ms ASC, seq ASC LIMIT ?4;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindI32(st, 1, static_cast<int>(resync::v1::REPLAY_STATUS_PENDING));
    BindI32(st, 2, static_cast<int>(resync::v1::REPLAY_STATUS_FAILED));
    BindI32(st, 3, static_cast<int>(resync::v1::REPLAY_STATUS_COMPLETED));
    BindU64(st, 4, limit);

    std::vector<model::ReplayItemRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadReplay(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::ReplayItemRecord>
SqliteRepository::ListReplayForEntity(Transaction& t, const std::string& entity_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kReplayColumns +
                            " FROM replay_queue WHERE entity_id=? ORDER BY created_at_ms ASC, seq ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, entity_id);

    std::vector<model::ReplayItemRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadReplay(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateReplay(Transaction& t, const model::ReplayItemRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE replay_queue SET payload=?,attempts=?,last_attempt_ms=?,status=?,error_message=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.payload);
    BindU64(st, 2, r.attempts);
    BindU64(st, 3, r.last_attempt_ms);
    BindI32(st, 4, static_cast<int>(r.status));
    BindText(st, 5, r.error_message);
    BindText(st, 6, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "replay item not found");
    return Translate(db, rc);
}

Result SqliteRepository::DeleteReplay(Transaction& t, const std::string& id) {
    return ExecById(TX(t).Handle(), "DELETE FROM replay_queue WHERE id=?;", id);
}

uint64_t SqliteRepository::ResetSyncingReplay(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE replay_queue SET status=? WHERE status=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindI32(st, 1, static_cast<int>(resync::v1::REPLAY_STATUS_PENDING));
    BindI32(st, 2, static_cast<int>(resync::v1::REPLAY_STATUS_SYNCING));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE) return 0;
    return static_cast<uint64_t>(sqlite3_changes(db));
}

ReplayCounts SqliteRepository::CountReplay(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT COUNT(*), COALESCE(SUM(CASE WHEN status=? THEN 1 ELSE 0 END),0), COALESCE(MIN(created_at_ms),0) "
        "FROM replay_queue WHERE status<>?;";

    ReplayCounts counts;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return counts;

    BindI32(st, 1, static_cast<int>(resync::v1::REPLAY_STATUS_FAILED));
    BindI32(st, 2, static_cast<int>(resync::v1::REPLAY_STATUS_COMPLETED));

    if (sqlite3_step(st) == SQLITE_ROW) {
        counts.backlog = ColU64(st, 0);
        counts.failed = ColU64(st, 1);
        counts.oldest_created_ms = ColU64(st, 2);
    }

    sqlite3_finalize(st);
    return counts;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO audit_log(id,action,target_type,target_id,actor_id,details,created_at_ms) VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.action);
    BindText(st, 3, r.target_type);
    BindText(st, 4, r.target_id);
    BindText(st, 5, r.actor_id);
    BindText(st, 6, r.details);
    BindU64(st, 7, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::AuditRecord>
SqliteRepository::ListAudit(Transaction& t, const std::string& target_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,action,target_type,target_id,actor_id,details,created_at_ms "
        "FROM audit_log WHERE target_id=? ORDER BY rowid ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindText(st, 1, target_id);

    std::vector<model::AuditRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::AuditRecord r;
        r.id = ColText(st, 0);
        r.action = ColText(st, 1);
        r.target_type = ColText(st, 2);
        r.target_id = ColText(st, 3);
        r.actor_id = ColText(st, 4);
        r.details = ColText(st, 5);
        r.created_at_ms = ColU64(st, 6);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace resync::db::sqlite
