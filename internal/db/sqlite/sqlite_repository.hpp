#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace docman::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDocument(Transaction&, model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) override;
  std::optional<model::DocumentRecord> FindDocumentByHash(Transaction&, const std::string& content_hash) override;
  Result UpdateDocument(Transaction&, const model::DocumentRecord&) override;
  Result DeleteDocument(Transaction&, int64_t id) override;

  Result InsertCopy(Transaction&, model::DocumentCopyRecord&) override;
  std::optional<model::DocumentCopyRecord> GetCopy(Transaction&, int64_t id) override;
  std::optional<model::DocumentCopyRecord> FindCopyByPath(Transaction&, const std::string& repository_path,
                                                          const std::string& file_path) override;
  Result UpdateCopy(Transaction&, const model::DocumentCopyRecord&) override;
  Result DeleteCopy(Transaction&, int64_t id) override;
  std::vector<model::DocumentCopyRecord> ListCopies(Transaction&, const std::string& repository_path) override;
  std::vector<model::DocumentCopyRecord> ListCopiesForDocument(Transaction&, int64_t document_id) override;

  Result UpsertPendingOperation(Transaction&, model::PendingOperationRecord&) override;
  std::optional<model::PendingOperationRecord> GetPendingOperation(Transaction&, int64_t id) override;
  std::optional<model::PendingOperationRecord> FindPendingOperationForCopy(Transaction&, int64_t copy_id) override;
  std::vector<model::PendingOperationRecord> ListPendingOperations(Transaction&,
                                                                   const std::string& repository_path) override;
  Result DeletePendingOperation(Transaction&, int64_t id) override;
  Result DeletePendingOperationsForCopy(Transaction&, int64_t copy_id) override;

  Result InsertOperation(Transaction&, model::OperationRecord&) override;
  std::vector<model::OperationRecord> ListOperations(Transaction&, const std::string& repository_path) override;
  std::vector<model::OperationRecord> ListOperationsForCopy(Transaction&, int64_t copy_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

}
