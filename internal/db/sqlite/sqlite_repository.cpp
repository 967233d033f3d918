#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace calltrace::db::sqlite {

using calltrace::db::ErrorCode;
using calltrace::db::Result;

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

StatementPtr PrepareStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return StatementPtr(st, sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

model::FunctionRecord ReadFunction(sqlite3_stmt* st) {
  model::FunctionRecord r;
  r.id           = ColI64(st, 0);
  r.module       = ColText(st, 1);
  r.qualname     = ColText(st, 2);
  r.filename     = ColText(st, 3);
  r.lineno       = ColI64(st, 4);
  r.signature    = ColText(st, 5);
  r.annotations  = ColOptText(st, 6);
  r.defaults     = ColOptText(st, 7);
  r.kwdefaults   = ColOptText(st, 8);
  r.closure_vars = ColOptText(st, 9);
  r.source_code  = ColOptText(st, 10);
  return r;
}

// columns as laid out by SELECT_CALL_COLUMNS
model::CallRecord ReadCall(sqlite3_stmt* st) {
  model::CallRecord r;
  r.id                = ColI64(st, 0);
  r.function_id       = ColI64(st, 1);
  r.parent_call_id    = ColOptI64(st, 2);
  r.timestamp         = sqlite3_column_double(st, 3);
  r.duration_ms       = ColOptDouble(st, 4);
  r.thread_id         = static_cast<uint64_t>(ColI64(st, 5));
  r.is_coroutine      = sqlite3_column_int(st, 6) != 0;
  r.method_type       = ColText(st, 7);
  r.class_name        = ColOptText(st, 8);
  r.return_value      = ColOptText(st, 9);
  r.exception_type    = ColOptText(st, 10);
  r.exception_message = ColOptText(st, 11);
  r.tb                = ColOptText(st, 12);
  return r;
}

std::vector<model::CallWithFunction> QueryCallsWithFunction(sqlite3* db, const std::string& sql) {
  std::vector<model::CallWithFunction> out;

  auto st = PrepareStatement(db, sql);
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::CallWithFunction row;
    row.call     = ReadCall(st.get());
    row.module   = ColText(st.get(), 13);
    row.qualname = ColText(st.get(), 14);
    out.push_back(std::move(row));
  }
  return out;
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

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Function
// ------------------------------------------------------------------

Result SqliteRepository::GetOrCreateFunction(Transaction& t, model::FunctionRecord& r) {
    auto* db = TX(t).Handle();

    // UNIQUE(module,qualname,filename,lineno) makes the insert a no-op
    // for a known identity; the select below then returns the first row.
    auto ins = PrepareStatement(db, sql::INSERT_FUNCTION_IF_ABSENT);
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(ins.get(), 1, r.module);
    BindText(ins.get(), 2, r.qualname);
    BindText(ins.get(), 3, r.filename);
    BindI64(ins.get(), 4, r.lineno);
    BindText(ins.get(), 5, r.signature);
    BindOptText(ins.get(), 6, r.annotations);
    BindOptText(ins.get(), 7, r.defaults);
    BindOptText(ins.get(), 8, r.kwdefaults);
    BindOptText(ins.get(), 9, r.closure_vars);
    BindOptText(ins.get(), 10, r.source_code);

    int rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    auto sel = PrepareStatement(db, sql::SELECT_FUNCTION_BY_KEY);
    if (!sel) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(sel.get(), 1, r.module);
    BindText(sel.get(), 2, r.qualname);
    BindText(sel.get(), 3, r.filename);
    BindI64(sel.get(), 4, r.lineno);

    rc = sqlite3_step(sel.get());
    if (rc != SQLITE_ROW) {
        if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "function row vanished after insert");
        return Translate(db, rc);
    }

    r = ReadFunction(sel.get());
    return Result::Ok();
}

std::optional<model::FunctionRecord> SqliteRepository::GetFunction(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStatement(db, sql::SELECT_FUNCTION_BY_ID);
    if (!st) return std::nullopt;

    BindI64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    return ReadFunction(st.get());
}

std::vector<model::FunctionRecord> SqliteRepository::ListFunctions(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::FunctionRecord> out;

    auto st = PrepareStatement(db, std::string(sql::SELECT_FUNCTION_COLUMNS) + " ORDER BY id;");
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadFunction(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Call
// ------------------------------------------------------------------

Result SqliteRepository::InsertCall(Transaction& t, model::CallRecord& r) {
    auto* db = TX(t).Handle();

    auto st = PrepareStatement(db, sql::INSERT_CALL);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.function_id);
    BindOptI64(st.get(), 2, r.parent_call_id);
    sqlite3_bind_double(st.get(), 3, r.timestamp);
    BindI64(st.get(), 4, static_cast<int64_t>(r.thread_id));
    sqlite3_bind_int(st.get(), 5, r.is_coroutine ? 1 : 0);
    BindText(st.get(), 6, r.method_type);
    BindOptText(st.get(), 7, r.class_name);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

Result SqliteRepository::CompleteCall(Transaction& t, int64_t call_id, const model::CallOutcome& o) {
    auto* db = TX(t).Handle();

    auto st = PrepareStatement(db, sql::COMPLETE_CALL);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    sqlite3_bind_double(st.get(), 1, o.duration_ms);
    BindOptText(st.get(), 2, o.return_value);
    BindOptText(st.get(), 3, o.exception_type);
    BindOptText(st.get(), 4, o.exception_message);
    BindOptText(st.get(), 5, o.tb);
    BindI64(st.get(), 6, call_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 1) return Result::Ok();

    // zero rows: either unknown id or already completed
    auto exists = PrepareStatement(db, sql::SELECT_CALL_EXISTS);
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(exists.get(), 1, call_id);

    if (sqlite3_step(exists.get()) == SQLITE_ROW)
        return Result::Err(ErrorCode::Conflict, "call " + std::to_string(call_id) + " already completed");
    return Result::Err(ErrorCode::NotFound, "call " + std::to_string(call_id) + " not found");
}

std::optional<model::CallRecord> SqliteRepository::GetCall(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    auto st = PrepareStatement(db, std::string(sql::SELECT_CALL_COLUMNS) + " WHERE c.id=?;");
    if (!st) return std::nullopt;

    BindI64(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    return ReadCall(st.get());
}

std::vector<model::CallRecord> SqliteRepository::ListCalls(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::CallRecord> out;

    auto st = PrepareStatement(db, std::string(sql::SELECT_CALL_COLUMNS) + " ORDER BY c.id;");
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadCall(st.get()));
    }
    return out;
}

std::vector<model::CallWithFunction> SqliteRepository::ListCallsWithFunction(Transaction& t) {
    return QueryCallsWithFunction(TX(t).Handle(),
                                  std::string(sql::SELECT_CALL_WITH_FUNCTION_COLUMNS) + " ORDER BY c.id;");
}

std::vector<model::CallWithFunction> SqliteRepository::ListFailedCalls(Transaction& t) {
    return QueryCallsWithFunction(TX(t).Handle(),
                                  std::string(sql::SELECT_CALL_WITH_FUNCTION_COLUMNS) +
                                      " WHERE c.exception_type IS NOT NULL ORDER BY c.id;");
}

// ------------------------------------------------------------------
// Argument
// ------------------------------------------------------------------

Result SqliteRepository::InsertArguments(Transaction& t, std::vector<model::ArgumentRecord>& records) {
    auto* db = TX(t).Handle();
    if (records.empty()) return Result::Ok();

    auto st = PrepareStatement(db, sql::INSERT_ARGUMENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    // all-or-nothing inside the caller's transaction
    db_->Exec("SAVEPOINT insert_arguments;");

    for (auto& r : records) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());

        BindI64(st.get(), 1, r.call_id);
        BindText(st.get(), 2, r.name);
        BindText(st.get(), 3, r.value);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) {
            auto err = Translate(db, rc);
            db_->Exec("ROLLBACK TO insert_arguments;");
            db_->Exec("RELEASE insert_arguments;");
            return err;
        }
        r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    }

    db_->Exec("RELEASE insert_arguments;");
    return Result::Ok();
}

std::vector<model::ArgumentRecord> SqliteRepository::GetArguments(Transaction& t, int64_t call_id) {
    auto* db = TX(t).Handle();
    std::vector<model::ArgumentRecord> out;

    auto st = PrepareStatement(db, sql::SELECT_ARGUMENTS_BY_CALL);
    if (!st) return out;

    BindI64(st.get(), 1, call_id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::ArgumentRecord r;
        r.id      = ColI64(st.get(), 0);
        r.call_id = ColI64(st.get(), 1);
        r.name    = ColText(st.get(), 2);
        r.value   = ColText(st.get(), 3);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<model::ArgumentWithCall> SqliteRepository::ListArgumentsWithCall(Transaction& t) {
    auto* db = TX(t).Handle();
    std::vector<model::ArgumentWithCall> out;

    auto st = PrepareStatement(db, sql::SELECT_ARGUMENTS_WITH_CALL);
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::ArgumentWithCall r;
        r.argument.id      = ColI64(st.get(), 0);
        r.argument.call_id = ColI64(st.get(), 1);
        r.argument.name    = ColText(st.get(), 2);
        r.argument.value   = ColText(st.get(), 3);
        r.function_id      = ColI64(st.get(), 4);
        r.timestamp        = sqlite3_column_double(st.get(), 5);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace calltrace::db::sqlite
