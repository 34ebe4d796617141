#pragma once

#include <string>
#include <vector>

namespace docman::db::sql {

/*
  Idempotent schema bootstrap, applied in order.

  Cascades:
    documents -> document_copies            ON DELETE CASCADE
    document_copies -> pending_operations   ON DELETE SET NULL
    document_copies -> operations           ON DELETE SET NULL
*/

inline const std::vector<std::string>& BootstrapStatements() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS documents ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " content_hash TEXT NOT NULL UNIQUE,"
      " content TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS document_copies ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,"
      " repository_path TEXT NOT NULL,"
      " file_path TEXT NOT NULL,"
      " stored_content_hash TEXT,"
      " stored_size INTEGER,"
      " stored_mtime_ns INTEGER,"
      " organization_status TEXT NOT NULL DEFAULT 'unorganized',"
      " last_seen_at_ms INTEGER,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " UNIQUE(repository_path, file_path));",

      "CREATE INDEX IF NOT EXISTS ix_document_copies_document_id ON document_copies(document_id);",

      "CREATE TABLE IF NOT EXISTS pending_operations ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " document_copy_id INTEGER UNIQUE REFERENCES document_copies(id) ON DELETE SET NULL,"
      " suggested_directory_path TEXT NOT NULL,"
      " suggested_filename TEXT NOT NULL,"
      " reason TEXT NOT NULL,"
      " confidence REAL NOT NULL DEFAULT 0,"
      " prompt_hash TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS operations ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " document_copy_id INTEGER REFERENCES document_copies(id) ON DELETE SET NULL,"
      " original_file_path TEXT NOT NULL,"
      " original_repository_path TEXT NOT NULL,"
      " suggested_directory_path TEXT NOT NULL,"
      " suggested_filename TEXT NOT NULL,"
      " reason TEXT NOT NULL,"
      " prompt_hash TEXT NOT NULL,"
      " final_file_path TEXT NOT NULL,"
      " outcome TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS ix_operations_original_repository_path ON operations(original_repository_path);",
  };
  return kBootstrapSql;
}

} // namespace docman::db::sql
