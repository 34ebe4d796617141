#pragma once

#include "sqlite_db.hpp"

namespace docman::db::sqlite {

// Creates missing tables and indexes. Safe to call on every open.
void BootstrapSchema(SqliteDB& db);

} // namespace docman::db::sqlite
