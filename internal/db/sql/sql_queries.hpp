#pragma once

namespace docman::db::sql {

/*
  Canonical SQL used by the relational backend.

  Column order in every SELECT matches the Read* helpers in
  sqlite_repository.cpp; keep them in sync.
*/

// documents

static constexpr const char* INSERT_DOCUMENT =
    "INSERT INTO documents(content_hash,content,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_DOCUMENT =
    "SELECT id,content_hash,content,created_at_ms,updated_at_ms"
    " FROM documents WHERE id=?;";

static constexpr const char* SELECT_DOCUMENT_BY_HASH =
    "SELECT id,content_hash,content,created_at_ms,updated_at_ms"
    " FROM documents WHERE content_hash=?;";

static constexpr const char* UPDATE_DOCUMENT =
    "UPDATE documents SET content_hash=?,content=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_DOCUMENT =
    "DELETE FROM documents WHERE id=?;";

// copies

#define DOCMAN_COPY_COLUMNS                                                                 \
  "id,document_id,repository_path,file_path,stored_content_hash,stored_size,stored_mtime_ns," \
  "organization_status,last_seen_at_ms,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_COPY =
    "INSERT INTO document_copies(document_id,repository_path,file_path,stored_content_hash,"
    "stored_size,stored_mtime_ns,organization_status,last_seen_at_ms,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_COPY =
    "SELECT " DOCMAN_COPY_COLUMNS " FROM document_copies WHERE id=?;";

static constexpr const char* SELECT_COPY_BY_PATH =
    "SELECT " DOCMAN_COPY_COLUMNS " FROM document_copies WHERE repository_path=? AND file_path=?;";

static constexpr const char* SELECT_COPIES_BY_REPOSITORY =
    "SELECT " DOCMAN_COPY_COLUMNS " FROM document_copies WHERE repository_path=? ORDER BY id;";

static constexpr const char* SELECT_COPIES_BY_DOCUMENT =
    "SELECT " DOCMAN_COPY_COLUMNS " FROM document_copies WHERE document_id=? ORDER BY id;";

static constexpr const char* UPDATE_COPY =
    "UPDATE document_copies SET document_id=?,repository_path=?,file_path=?,stored_content_hash=?,"
    "stored_size=?,stored_mtime_ns=?,organization_status=?,last_seen_at_ms=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_COPY =
    "DELETE FROM document_copies WHERE id=?;";

#undef DOCMAN_COPY_COLUMNS

// pending operations

static constexpr const char* INSERT_PENDING =
    "INSERT INTO pending_operations(document_copy_id,suggested_directory_path,suggested_filename,"
    "reason,confidence,prompt_hash,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PENDING =
    "SELECT id,document_copy_id,suggested_directory_path,suggested_filename,reason,confidence,"
    "prompt_hash,created_at_ms FROM pending_operations WHERE id=?;";

static constexpr const char* SELECT_PENDING_FOR_COPY =
    "SELECT id,document_copy_id,suggested_directory_path,suggested_filename,reason,confidence,"
    "prompt_hash,created_at_ms FROM pending_operations WHERE document_copy_id=?;";

static constexpr const char* SELECT_PENDING_BY_REPOSITORY =
    "SELECT p.id,p.document_copy_id,p.suggested_directory_path,p.suggested_filename,p.reason,"
    "p.confidence,p.prompt_hash,p.created_at_ms"
    " FROM pending_operations p JOIN document_copies c ON c.id=p.document_copy_id"
    " WHERE c.repository_path=? ORDER BY p.id;";

static constexpr const char* DELETE_PENDING =
    "DELETE FROM pending_operations WHERE id=?;";

static constexpr const char* DELETE_PENDING_FOR_COPY =
    "DELETE FROM pending_operations WHERE document_copy_id=?;";

// operation history

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO operations(document_copy_id,original_file_path,original_repository_path,"
    "suggested_directory_path,suggested_filename,reason,prompt_hash,final_file_path,outcome,"
    "created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_OPERATIONS_BY_REPOSITORY =
    "SELECT id,document_copy_id,original_file_path,original_repository_path,suggested_directory_path,"
    "suggested_filename,reason,prompt_hash,final_file_path,outcome,created_at_ms,updated_at_ms"
    " FROM operations WHERE original_repository_path=? ORDER BY id;";

static constexpr const char* SELECT_OPERATIONS_FOR_COPY =
    "SELECT id,document_copy_id,original_file_path,original_repository_path,suggested_directory_path,"
    "suggested_filename,reason,prompt_hash,final_file_path,outcome,created_at_ms,updated_at_ms"
    " FROM operations WHERE document_copy_id=? ORDER BY id;";

}
