#include "sqlite_schema.hpp"

#include "internal/db/sql/schema.hpp"

namespace docman::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  for (const auto& sql : sql::BootstrapStatements()) {
    db.Exec(sql);
  }

  // fail fast if an older layout is on disk
  db.Exec("SELECT id,content_hash,content,created_at_ms,updated_at_ms FROM documents LIMIT 1;");
  db.Exec("SELECT stored_content_hash,stored_size,stored_mtime_ns,organization_status,last_seen_at_ms FROM document_copies LIMIT 1;");
  db.Exec("SELECT document_copy_id,prompt_hash,confidence FROM pending_operations LIMIT 1;");
  db.Exec("SELECT original_file_path,original_repository_path,final_file_path,outcome FROM operations LIMIT 1;");
}

} // namespace docman::db::sqlite
