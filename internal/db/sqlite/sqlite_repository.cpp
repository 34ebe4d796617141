#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docman::db::sqlite {

using docman::db::ErrorCode;
using docman::db::Result;

namespace {

// Finalizes on scope exit so row readers may throw.
struct Statement {
    sqlite3_stmt* st = nullptr;
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

template <typename T>
void BindOpt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
        return;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        BindText(st, idx, *v);
    } else {
        BindI64(st, idx, static_cast<int64_t>(*v));
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (ColNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (ColNull(st, col)) return std::nullopt;
    return ColI64(st, col);
}

Result Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
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

void PrepareOrThrow(sqlite3* db, const char* sql, Statement& stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

// Single-statement write. Returns the translated step result.
template <typename Bind>
Result Execute(sqlite3* db, const char* sql, Bind&& bind) {
    Statement stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    bind(stmt.st);
    return Translate(db, sqlite3_step(stmt.st));
}

template <typename Row, typename Bind, typename Read>
std::vector<Row> QueryRows(sqlite3* db, const char* sql, Bind&& bind, Read&& read) {
    Statement stmt;
    PrepareOrThrow(db, sql, stmt);
    bind(stmt.st);

    std::vector<Row> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(read(stmt.st));
    }
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    return out;
}

template <typename Row, typename Bind, typename Read>
std::optional<Row> QueryOne(sqlite3* db, const char* sql, Bind&& bind, Read&& read) {
    auto rows = QueryRows<Row>(db, sql, std::forward<Bind>(bind), std::forward<Read>(read));
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

model::DocumentRecord ReadDocument(sqlite3_stmt* st) {
    model::DocumentRecord r;
    r.id            = ColI64(st, 0);
    r.content_hash  = ColText(st, 1);
    r.content       = ColOptText(st, 2);
    r.created_at_ms = ColU64(st, 3);
    r.updated_at_ms = ColU64(st, 4);
    return r;
}

model::DocumentCopyRecord ReadCopy(sqlite3_stmt* st) {
    model::DocumentCopyRecord r;
    r.id                  = ColI64(st, 0);
    r.document_id         = ColI64(st, 1);
    r.repository_path     = ColText(st, 2);
    r.file_path           = ColText(st, 3);
    r.stored_content_hash = ColOptText(st, 4);
    if (!ColNull(st, 5)) r.stored_size = ColU64(st, 5);
    r.stored_mtime_ns = ColOptI64(st, 6);

    const auto status = ColText(st, 7);
    auto       parsed = docman::model::ParseOrganizationStatus(status);
    if (!parsed) {
        throw util::InvalidState("document copy " + std::to_string(r.id) + " has unknown organization_status '" + status + "'");
    }
    r.organization_status = *parsed;

    if (!ColNull(st, 8)) r.last_seen_at_ms = ColU64(st, 8);
    r.created_at_ms = ColU64(st, 9);
    r.updated_at_ms = ColU64(st, 10);
    return r;
}

model::PendingOperationRecord ReadPending(sqlite3_stmt* st) {
    model::PendingOperationRecord r;
    r.id                       = ColI64(st, 0);
    r.document_copy_id         = ColOptI64(st, 1);
    r.suggested_directory_path = ColText(st, 2);
    r.suggested_filename       = ColText(st, 3);
    r.reason                   = ColText(st, 4);
    r.confidence               = sqlite3_column_double(st, 5);
    r.prompt_hash              = ColText(st, 6);
    r.created_at_ms            = ColU64(st, 7);
    return r;
}

model::OperationRecord ReadOperation(sqlite3_stmt* st) {
    model::OperationRecord r;
    r.id                       = ColI64(st, 0);
    r.document_copy_id         = ColOptI64(st, 1);
    r.original_file_path       = ColText(st, 2);
    r.original_repository_path = ColText(st, 3);
    r.suggested_directory_path = ColText(st, 4);
    r.suggested_filename       = ColText(st, 5);
    r.reason                   = ColText(st, 6);
    r.prompt_hash              = ColText(st, 7);
    r.final_file_path          = ColText(st, 8);

    const auto outcome = ColText(st, 9);
    auto       parsed  = docman::model::ParseOperationOutcome(outcome);
    if (!parsed) {
        throw util::InvalidState("operation " + std::to_string(r.id) + " has unknown outcome '" + outcome + "'");
    }
    r.outcome = *parsed;

    r.created_at_ms = ColU64(st, 10);
    r.updated_at_ms = ColU64(st, 11);
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

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
    if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

    auto result = Execute(db, sql::INSERT_DOCUMENT, [&](sqlite3_stmt* st) {
        BindText(st, 1, r.content_hash);
        BindOpt(st, 2, r.content);
        BindU64(st, 3, r.created_at_ms);
        BindU64(st, 4, r.updated_at_ms);
    });
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, int64_t id) {
    return QueryOne<model::DocumentRecord>(
        TX(t).Handle(), sql::SELECT_DOCUMENT, [&](sqlite3_stmt* st) { BindI64(st, 1, id); }, ReadDocument);
}

std::optional<model::DocumentRecord> SqliteRepository::FindDocumentByHash(Transaction& t, const std::string& content_hash) {
    return QueryOne<model::DocumentRecord>(
        TX(t).Handle(), sql::SELECT_DOCUMENT_BY_HASH, [&](sqlite3_stmt* st) { BindText(st, 1, content_hash); }, ReadDocument);
}

Result SqliteRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
    auto* db = TX(t).Handle();

    auto result = Execute(db, sql::UPDATE_DOCUMENT, [&](sqlite3_stmt* st) {
        BindText(st, 1, r.content_hash);
        BindOpt(st, 2, r.content);
        BindU64(st, 3, util::NowMs());
        BindI64(st, 4, r.id);
    });
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

Result SqliteRepository::DeleteDocument(Transaction& t, int64_t id) {
    return Execute(TX(t).Handle(), sql::DELETE_DOCUMENT, [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
}

// ------------------------------------------------------------------
// Copies
// ------------------------------------------------------------------

Result SqliteRepository::InsertCopy(Transaction& t, model::DocumentCopyRecord& r) {
    auto* db = TX(t).Handle();

    if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
    if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

    auto result = Execute(db, sql::INSERT_COPY, [&](sqlite3_stmt* st) {
        BindI64(st, 1, r.document_id);
        BindText(st, 2, r.repository_path);
        BindText(st, 3, r.file_path);
        BindOpt(st, 4, r.stored_content_hash);
        BindOpt(st, 5, r.stored_size);
        BindOpt(st, 6, r.stored_mtime_ns);
        BindText(st, 7, std::string(docman::model::ToString(r.organization_status)));
        BindOpt(st, 8, r.last_seen_at_ms);
        BindU64(st, 9, r.created_at_ms);
        BindU64(st, 10, r.updated_at_ms);
    });
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::DocumentCopyRecord> SqliteRepository::GetCopy(Transaction& t, int64_t id) {
    return QueryOne<model::DocumentCopyRecord>(
        TX(t).Handle(), sql::SELECT_COPY, [&](sqlite3_stmt* st) { BindI64(st, 1, id); }, ReadCopy);
}

std::optional<model::DocumentCopyRecord> SqliteRepository::FindCopyByPath(Transaction& t, const std::string& repository_path,
                                                                          const std::string& file_path) {
    return QueryOne<model::DocumentCopyRecord>(
        TX(t).Handle(), sql::SELECT_COPY_BY_PATH,
        [&](sqlite3_stmt* st) {
            BindText(st, 1, repository_path);
            BindText(st, 2, file_path);
        },
        ReadCopy);
}

Result SqliteRepository::UpdateCopy(Transaction& t, const model::DocumentCopyRecord& r) {
    auto* db = TX(t).Handle();

    auto result = Execute(db, sql::UPDATE_COPY, [&](sqlite3_stmt* st) {
        BindI64(st, 1, r.document_id);
        BindText(st, 2, r.repository_path);
        BindText(st, 3, r.file_path);
        BindOpt(st, 4, r.stored_content_hash);
        BindOpt(st, 5, r.stored_size);
        BindOpt(st, 6, r.stored_mtime_ns);
        BindText(st, 7, std::string(docman::model::ToString(r.organization_status)));
        BindOpt(st, 8, r.last_seen_at_ms);
        BindU64(st, 9, util::NowMs());
        BindI64(st, 10, r.id);
    });
    if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

Result SqliteRepository::DeleteCopy(Transaction& t, int64_t id) {
    return Execute(TX(t).Handle(), sql::DELETE_COPY, [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
}

std::vector<model::DocumentCopyRecord> SqliteRepository::ListCopies(Transaction& t, const std::string& repository_path) {
    return QueryRows<model::DocumentCopyRecord>(
        TX(t).Handle(), sql::SELECT_COPIES_BY_REPOSITORY, [&](sqlite3_stmt* st) { BindText(st, 1, repository_path); }, ReadCopy);
}

std::vector<model::DocumentCopyRecord> SqliteRepository::ListCopiesForDocument(Transaction& t, int64_t document_id) {
    return QueryRows<model::DocumentCopyRecord>(
        TX(t).Handle(), sql::SELECT_COPIES_BY_DOCUMENT, [&](sqlite3_stmt* st) { BindI64(st, 1, document_id); }, ReadCopy);
}

// ------------------------------------------------------------------
// Pending operations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPendingOperation(Transaction& t, model::PendingOperationRecord& r) {
    auto* db = TX(t).Handle();

    if (!r.document_copy_id) {
        return Result::Err(ErrorCode::ConstraintViolation, "pending operation requires a document copy");
    }

    // one per copy: drop the previous suggestion first
    auto removed = DeletePendingOperationsForCopy(t, *r.document_copy_id);
    if (!removed) return removed;

    if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();

    auto result = Execute(db, sql::INSERT_PENDING, [&](sqlite3_stmt* st) {
        BindOpt(st, 1, r.document_copy_id);
        BindText(st, 2, r.suggested_directory_path);
        BindText(st, 3, r.suggested_filename);
        BindText(st, 4, r.reason);
        BindDouble(st, 5, r.confidence);
        BindText(st, 6, r.prompt_hash);
        BindU64(st, 7, r.created_at_ms);
    });
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::PendingOperationRecord> SqliteRepository::GetPendingOperation(Transaction& t, int64_t id) {
    return QueryOne<model::PendingOperationRecord>(
        TX(t).Handle(), sql::SELECT_PENDING, [&](sqlite3_stmt* st) { BindI64(st, 1, id); }, ReadPending);
}

std::optional<model::PendingOperationRecord> SqliteRepository::FindPendingOperationForCopy(Transaction& t, int64_t copy_id) {
    return QueryOne<model::PendingOperationRecord>(
        TX(t).Handle(), sql::SELECT_PENDING_FOR_COPY, [&](sqlite3_stmt* st) { BindI64(st, 1, copy_id); }, ReadPending);
}

std::vector<model::PendingOperationRecord> SqliteRepository::ListPendingOperations(Transaction& t,
                                                                                   const std::string& repository_path) {
    return QueryRows<model::PendingOperationRecord>(
        TX(t).Handle(), sql::SELECT_PENDING_BY_REPOSITORY, [&](sqlite3_stmt* st) { BindText(st, 1, repository_path); },
        ReadPending);
}

Result SqliteRepository::DeletePendingOperation(Transaction& t, int64_t id) {
    return Execute(TX(t).Handle(), sql::DELETE_PENDING, [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
}

Result SqliteRepository::DeletePendingOperationsForCopy(Transaction& t, int64_t copy_id) {
    return Execute(TX(t).Handle(), sql::DELETE_PENDING_FOR_COPY, [&](sqlite3_stmt* st) { BindI64(st, 1, copy_id); });
}

// ------------------------------------------------------------------
// Operation history
// ------------------------------------------------------------------

Result SqliteRepository::InsertOperation(Transaction& t, model::OperationRecord& r) {
    auto* db = TX(t).Handle();

    if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
    if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

    auto result = Execute(db, sql::INSERT_OPERATION, [&](sqlite3_stmt* st) {
        BindOpt(st, 1, r.document_copy_id);
        BindText(st, 2, r.original_file_path);
        BindText(st, 3, r.original_repository_path);
        BindText(st, 4, r.suggested_directory_path);
        BindText(st, 5, r.suggested_filename);
        BindText(st, 6, r.reason);
        BindText(st, 7, r.prompt_hash);
        BindText(st, 8, r.final_file_path);
        BindText(st, 9, std::string(docman::model::ToString(r.outcome)));
        BindU64(st, 10, r.created_at_ms);
        BindU64(st, 11, r.updated_at_ms);
    });
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::OperationRecord> SqliteRepository::ListOperations(Transaction& t, const std::string& repository_path) {
    return QueryRows<model::OperationRecord>(
        TX(t).Handle(), sql::SELECT_OPERATIONS_BY_REPOSITORY, [&](sqlite3_stmt* st) { BindText(st, 1, repository_path); },
        ReadOperation);
}

std::vector<model::OperationRecord> SqliteRepository::ListOperationsForCopy(Transaction& t, int64_t copy_id) {
    return QueryRows<model::OperationRecord>(
        TX(t).Handle(), sql::SELECT_OPERATIONS_FOR_COPY, [&](sqlite3_stmt* st) { BindI64(st, 1, copy_id); }, ReadOperation);
}

} // namespace docman::db::sqlite
