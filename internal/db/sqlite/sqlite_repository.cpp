#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace meshdispatch::db::sqlite {

using meshdispatch::db::ErrorCode;
using meshdispatch::db::Result;

namespace {

constexpr const char* kDeliveryColumns =
    "id,address,lat,lon,status,assigned_unit_id,failure_reason,created_at_ms,status_changed_at_ms,"
    "assigned_at_ms,en_route_at_ms,arrived_at_ms,completed_at_ms,version";

constexpr const char* kUnitColumns =
    "id,status,assigned_delivery_id,last_lat,last_lon,last_contact_ms,status_before_offline,version";

constexpr const char* kPendingAckColumns =
    "msg_id,unit_id,delivery_id,kind,payload,created_at_ms,attempts,next_retry_ms";

// Finalizes the statement on scope exit.
struct Stmt {
    sqlite3_stmt* st = nullptr;
    ~Stmt() {
        if (st) sqlite3_finalize(st);
    }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) sqlite3_bind_double(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
    if (v) BindI64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

bool IsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return sqlite3_column_double(st, col);
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColI64(st, col);
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

model::DeliveryRecord ReadDelivery(sqlite3_stmt* st) {
    model::DeliveryRecord r;
    r.id                   = ColI64(st, 0);
    r.address              = ColText(st, 1);
    r.lat                  = ColOptDouble(st, 2);
    r.lon                  = ColOptDouble(st, 3);
    r.status               = static_cast<meshdispatch::v1::DeliveryStatus>(ColI32(st, 4));
    r.assigned_unit_id     = ColOptText(st, 5);
    r.failure_reason       = ColOptText(st, 6);
    r.created_at_ms        = ColI64(st, 7);
    r.status_changed_at_ms = ColI64(st, 8);
    r.assigned_at_ms       = ColI64(st, 9);
    r.en_route_at_ms       = ColI64(st, 10);
    r.arrived_at_ms        = ColI64(st, 11);
    r.completed_at_ms      = ColI64(st, 12);
    r.version              = ColU64(st, 13);
    return r;
}

model::UnitRecord ReadUnit(sqlite3_stmt* st) {
    model::UnitRecord r;
    r.id                    = ColText(st, 0);
    r.status                = static_cast<meshdispatch::v1::UnitStatus>(ColI32(st, 1));
    r.assigned_delivery_id  = ColOptI64(st, 2);
    r.last_lat              = ColOptDouble(st, 3);
    r.last_lon              = ColOptDouble(st, 4);
    r.last_contact_ms       = ColI64(st, 5);
    r.status_before_offline = static_cast<meshdispatch::v1::UnitStatus>(ColI32(st, 6));
    r.version               = ColU64(st, 7);
    return r;
}

model::PendingAckRecord ReadPendingAck(sqlite3_stmt* st) {
    model::PendingAckRecord r;
    r.msg_id        = ColText(st, 0);
    r.unit_id       = ColText(st, 1);
    r.delivery_id   = ColI64(st, 2);
    r.kind          = static_cast<model::PendingAckKind>(ColI32(st, 3));
    r.payload       = ColText(st, 4);
    r.created_at_ms = ColI64(st, 5);
    r.attempts      = static_cast<std::uint32_t>(ColI64(st, 6));
    r.next_retry_ms = ColI64(st, 7);
    return r;
}

} // namespace

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

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result SqliteRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO deliveries(address,lat,lon,status,assigned_unit_id,failure_reason,created_at_ms,"
        "status_changed_at_ms,assigned_at_ms,en_route_at_ms,arrived_at_ms,completed_at_ms,version) "
        "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,1);";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.address);
    BindOptDouble(s.st, 2, r.lat);
    BindOptDouble(s.st, 3, r.lon);
    BindI32(s.st, 4, static_cast<int>(r.status));
    BindOptText(s.st, 5, r.assigned_unit_id);
    BindOptText(s.st, 6, r.failure_reason);
    BindI64(s.st, 7, r.created_at_ms);
    BindI64(s.st, 8, r.status_changed_at_ms);
    BindI64(s.st, 9, r.assigned_at_ms);
    BindI64(s.st, 10, r.en_route_at_ms);
    BindI64(s.st, 11, r.arrived_at_ms);
    BindI64(s.st, 12, r.completed_at_ms);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id      = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    r.version = 1;
    return Result::Ok();
}

std::optional<model::DeliveryRecord>
SqliteRepository::GetDelivery(Transaction& t, std::int64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeliveryColumns + " FROM deliveries WHERE id=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindI64(s.st, 1, id);

    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
    return ReadDelivery(s.st);
}

std::vector<model::DeliveryRecord> SqliteRepository::ListDeliveries(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeliveryColumns + " FROM deliveries ORDER BY id;";

    std::vector<model::DeliveryRecord> out;
    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ReadDelivery(s.st));
    }
    return out;
}

std::vector<model::DeliveryRecord>
SqliteRepository::FindActiveDeliveriesForUnit(Transaction& t, const std::string& unit_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDeliveryColumns +
                            " FROM deliveries WHERE assigned_unit_id=? AND status IN (?,?,?) ORDER BY id;";

    std::vector<model::DeliveryRecord> out;
    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return out;

    BindText(s.st, 1, unit_id);
    BindI32(s.st, 2, meshdispatch::v1::DELIVERY_STATUS_ASSIGNED);
    BindI32(s.st, 3, meshdispatch::v1::DELIVERY_STATUS_EN_ROUTE);
    BindI32(s.st, 4, meshdispatch::v1::DELIVERY_STATUS_ARRIVED_DEST);

    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ReadDelivery(s.st));
    }
    return out;
}

Result SqliteRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r, std::uint64_t expected_version) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE deliveries SET address=?,lat=?,lon=?,status=?,assigned_unit_id=?,failure_reason=?,"
        "status_changed_at_ms=?,assigned_at_ms=?,en_route_at_ms=?,arrived_at_ms=?,completed_at_ms=?,version=? "
        "WHERE id=? AND version=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.address);
    BindOptDouble(s.st, 2, r.lat);
    BindOptDouble(s.st, 3, r.lon);
    BindI32(s.st, 4, static_cast<int>(r.status));
    BindOptText(s.st, 5, r.assigned_unit_id);
    BindOptText(s.st, 6, r.failure_reason);
    BindI64(s.st, 7, r.status_changed_at_ms);
    BindI64(s.st, 8, r.assigned_at_ms);
    BindI64(s.st, 9, r.en_route_at_ms);
    BindI64(s.st, 10, r.arrived_at_ms);
    BindI64(s.st, 11, r.completed_at_ms);
    BindU64(s.st, 12, expected_version + 1);
    BindI64(s.st, 13, r.id);
    BindU64(s.st, 14, expected_version);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        Stmt exists;
        sqlite3_prepare_v2(db, "SELECT 1 FROM deliveries WHERE id=?;", -1, &exists.st, nullptr);
        if (!exists.st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindI64(exists.st, 1, r.id);
        if (sqlite3_step(exists.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound);
        return Result::Err(ErrorCode::Conflict, "delivery version changed");
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Units
// ------------------------------------------------------------------

Result SqliteRepository::InsertUnit(Transaction& t, model::UnitRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO units(id,status,assigned_delivery_id,last_lat,last_lon,last_contact_ms,status_before_offline,version) "
        "VALUES(?,?,?,?,?,?,?,1);";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.id);
    BindI32(s.st, 2, static_cast<int>(r.status));
    BindOptI64(s.st, 3, r.assigned_delivery_id);
    BindOptDouble(s.st, 4, r.last_lat);
    BindOptDouble(s.st, 5, r.last_lon);
    BindI64(s.st, 6, r.last_contact_ms);
    BindI32(s.st, 7, static_cast<int>(r.status_before_offline));

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.version = 1;
    return Result::Ok();
}

std::optional<model::UnitRecord> SqliteRepository::GetUnit(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kUnitColumns + " FROM units WHERE id=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(s.st, 1, id);

    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
    return ReadUnit(s.st);
}

std::vector<model::UnitRecord> SqliteRepository::ListUnits(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kUnitColumns + " FROM units ORDER BY id;";

    std::vector<model::UnitRecord> out;
    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ReadUnit(s.st));
    }
    return out;
}

Result SqliteRepository::UpdateUnit(Transaction& t, const model::UnitRecord& r, std::uint64_t expected_version) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE units SET status=?,assigned_delivery_id=?,last_lat=?,last_lon=?,last_contact_ms=?,"
        "status_before_offline=?,version=? WHERE id=? AND version=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(s.st, 1, static_cast<int>(r.status));
    BindOptI64(s.st, 2, r.assigned_delivery_id);
    BindOptDouble(s.st, 3, r.last_lat);
    BindOptDouble(s.st, 4, r.last_lon);
    BindI64(s.st, 5, r.last_contact_ms);
    BindI32(s.st, 6, static_cast<int>(r.status_before_offline));
    BindU64(s.st, 7, expected_version + 1);
    BindText(s.st, 8, r.id);
    BindU64(s.st, 9, expected_version);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        Stmt probe;
        sqlite3_prepare_v2(db, "SELECT 1 FROM units WHERE id=?;", -1, &probe.st, nullptr);
        if (!probe.st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(probe.st, 1, r.id);
        if (sqlite3_step(probe.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound);
        return Result::Err(ErrorCode::Conflict, "unit version changed");
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Pending acknowledgments
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingAck(Transaction& t, const model::PendingAckRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO pending_acks(msg_id,unit_id,delivery_id,kind,payload,created_at_ms,attempts,next_retry_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.msg_id);
    BindText(s.st, 2, r.unit_id);
    BindI64(s.st, 3, r.delivery_id);
    BindI32(s.st, 4, static_cast<int>(r.kind));
    BindText(s.st, 5, r.payload);
    BindI64(s.st, 6, r.created_at_ms);
    BindI64(s.st, 7, r.attempts);
    BindI64(s.st, 8, r.next_retry_ms);

    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::PendingAckRecord>
SqliteRepository::GetPendingAck(Transaction& t, const std::string& msg_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPendingAckColumns + " FROM pending_acks WHERE msg_id=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(s.st, 1, msg_id);

    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
    return ReadPendingAck(s.st);
}

std::vector<model::PendingAckRecord> SqliteRepository::ListPendingAcks(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPendingAckColumns + " FROM pending_acks ORDER BY next_retry_ms;";

    std::vector<model::PendingAckRecord> out;
    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ReadPendingAck(s.st));
    }
    return out;
}

std::vector<model::PendingAckRecord>
SqliteRepository::FindPendingAcksForDelivery(Transaction& t, std::int64_t delivery_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPendingAckColumns + " FROM pending_acks WHERE delivery_id=?;";

    std::vector<model::PendingAckRecord> out;
    Stmt s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return out;

    BindI64(s.st, 1, delivery_id);

    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ReadPendingAck(s.st));
    }
    return out;
}

Result SqliteRepository::UpdatePendingAck(Transaction& t, const model::PendingAckRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE pending_acks SET attempts=?,next_retry_ms=? WHERE msg_id=?;";

    Stmt s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(s.st, 1, r.attempts);
    BindI64(s.st, 2, r.next_retry_ms);
    BindText(s.st, 3, r.msg_id);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeletePendingAck(Transaction& t, const std::string& msg_id) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, "DELETE FROM pending_acks WHERE msg_id=?;", -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, msg_id);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

} // namespace meshdispatch::db::sqlite
