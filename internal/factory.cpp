#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/extraction/plain_text_extractor.hpp"
#include "internal/observability/logging.hpp"
#if DOCMAN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace docman::factory {

using docman::observability::BoolField;
using docman::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const docman::config::v1::AppConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCMAN_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("sqlite backend requires database.sqlite.path");
    }

    const auto      parent = std::filesystem::path(sqlite.path()).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw std::runtime_error("cannot create database directory " + parent.string() + ": " + ec.message());
      }
    }

    const bool wal_mode  = !sqlite.has_wal_mode() || sqlite.wal_mode();
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), wal_mode);
    db::sqlite::BootstrapSchema(*sqlite_db);
    DOCMAN_LOG_INFO("opened sqlite store", {StringField("path", sqlite.path()), BoolField("wal_mode", wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  DOCMAN_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const docman::config::v1::AppConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  rt.hasher    = std::make_shared<storage::Sha256ContentHasher>(config.scan().hash_chunk_bytes());
  rt.extractor = std::make_shared<extraction::PlainTextExtractor>();
  rt.discovery = storage::DiscoveryOptions::FromConfig(config.scan());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  rt.processor = std::make_shared<core::DocumentProcessor>(rt.repository, rt.hasher, rt.extractor);
  rt.catalog   = std::make_shared<core::DocumentCatalog>(rt.repository);
  rt.applier   = std::make_shared<core::OrganizationApplier>(rt.repository);

  return rt;
}

} // namespace docman::factory
