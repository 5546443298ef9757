#include "sqlite_audit_log.hpp"

#include <sqlite3.h>

namespace provgate::db::sqlite {

using provgate::db::ErrorCode;
using provgate::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static model::ReceiptRecord ReadReceiptRow(sqlite3_stmt* st) {
    model::ReceiptRecord r;
    r.offset = static_cast<uint64_t>(ColI64(st, 0));
    r.receipt_id = ColText(st, 1);
    r.operation_id = ColText(st, 2);
    r.stage = static_cast<int>(ColI64(st, 3));
    r.issued_at_us = ColI64(st, 4);
    r.digest = ColText(st, 5);
    r.payload = ColBlob(st, 6);
    return r;
}

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    db_->Migrate();
}

std::unique_ptr<db::Transaction> SqliteAuditLog::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteAuditLog::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteAuditLog::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
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
// Receipts
// ------------------------------------------------------------------

Result SqliteAuditLog::AppendReceipt(Transaction& t, model::ReceiptRecord& r) {
    auto* db = TX(t).Handle();

    if (r.receipt_id.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "receipt id is empty");

    // duplicate ids are a no-op, not a constraint error
    auto exists = Prepare(db, "SELECT 1 FROM receipts WHERE receipt_id=?;");
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(exists.get(), 1, r.receipt_id);
    const int exists_rc = sqlite3_step(exists.get());
    if (exists_rc == SQLITE_ROW)
        return Result::Err(ErrorCode::AlreadyExists, r.receipt_id);
    if (exists_rc != SQLITE_DONE)
        return Translate(db, exists_rc);

    auto max_st = Prepare(db, "SELECT COALESCE(MAX(log_offset), -1) FROM receipts;");
    if (!max_st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    uint64_t next_offset = 0;
    if (sqlite3_step(max_st.get()) == SQLITE_ROW) {
        next_offset = static_cast<uint64_t>(sqlite3_column_int64(max_st.get(), 0) + 1);
    }

    auto ins = Prepare(db,
        "INSERT INTO receipts(log_offset,receipt_id,operation_id,stage,issued_at_us,digest,payload) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(ins.get(), 1, static_cast<int64_t>(next_offset));
    BindText(ins.get(), 2, r.receipt_id);
    BindText(ins.get(), 3, r.operation_id);
    BindI64(ins.get(), 4, r.stage);
    BindI64(ins.get(), 5, r.issued_at_us);
    BindText(ins.get(), 6, r.digest);
    BindBlob(ins.get(), 7, r.payload);

    const int rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    r.offset = next_offset;
    return Result::Ok();
}

std::optional<model::ReceiptRecord> SqliteAuditLog::GetReceipt(Transaction& t, const std::string& receipt_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT log_offset,receipt_id,operation_id,stage,issued_at_us,digest,payload "
        "FROM receipts WHERE receipt_id=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, receipt_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadReceiptRow(st.get());
}

std::vector<model::ReceiptRecord> SqliteAuditLog::ReadReceipts(
    Transaction& t, const model::ReceiptFilter& filter, uint64_t start_offset, uint64_t max_entries) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT log_offset,receipt_id,operation_id,stage,issued_at_us,digest,payload "
        "FROM receipts WHERE log_offset>=?";
    if (filter.operation_id) sql += " AND operation_id=?";
    if (filter.stage) sql += " AND stage=?";
    if (filter.from_us) sql += " AND issued_at_us>=?";
    if (filter.to_us) sql += " AND issued_at_us<=?";
    sql += " ORDER BY log_offset ASC LIMIT ?;";

    auto st = Prepare(db, sql);
    if (!st) return {};

    int bind_idx = 1;
    BindI64(st.get(), bind_idx++, static_cast<int64_t>(start_offset));
    if (filter.operation_id) BindText(st.get(), bind_idx++, *filter.operation_id);
    if (filter.stage) BindI64(st.get(), bind_idx++, *filter.stage);
    if (filter.from_us) BindI64(st.get(), bind_idx++, *filter.from_us);
    if (filter.to_us) BindI64(st.get(), bind_idx++, *filter.to_us);
    BindI64(st.get(), bind_idx++, static_cast<int64_t>(max_entries));

    std::vector<model::ReceiptRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadReceiptRow(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result SqliteAuditLog::AppendBatch(Transaction& t, model::BatchRow& row) {
    auto* db = TX(t).Handle();

    auto max_st = Prepare(db, "SELECT COALESCE(MAX(sequence), -1) FROM batches;");
    if (!max_st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    uint64_t next_sequence = 0;
    if (sqlite3_step(max_st.get()) == SQLITE_ROW) {
        next_sequence = static_cast<uint64_t>(sqlite3_column_int64(max_st.get(), 0) + 1);
    }

    auto ins = Prepare(db, "INSERT INTO batches(sequence,batch_id,sealed_at_us,payload) VALUES(?,?,?,?);");
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(ins.get(), 1, static_cast<int64_t>(next_sequence));
    BindText(ins.get(), 2, row.batch_id);
    BindI64(ins.get(), 3, row.sealed_at_us);
    BindBlob(ins.get(), 4, row.payload);

    const int rc = sqlite3_step(ins.get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, row.batch_id);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    row.sequence = next_sequence;
    return Result::Ok();
}

std::vector<model::BatchRow> SqliteAuditLog::ReadBatches(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT sequence,batch_id,sealed_at_us,payload FROM batches ORDER BY sequence ASC;");
    if (!st) return {};

    std::vector<model::BatchRow> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::BatchRow row;
        row.sequence = static_cast<uint64_t>(ColI64(st.get(), 0));
        row.batch_id = ColText(st.get(), 1);
        row.sealed_at_us = ColI64(st.get(), 2);
        row.payload = ColBlob(st.get(), 3);
        out.push_back(std::move(row));
    }
    return out;
}

}
