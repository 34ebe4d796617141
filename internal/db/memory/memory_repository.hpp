#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace docman::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::DocumentRecord>          documents;
    std::unordered_map<std::string, int64_t>          document_by_hash;
    std::map<int64_t, model::DocumentCopyRecord>      copies;
    std::unordered_map<std::string, int64_t>          copy_by_path;
    std::map<int64_t, model::PendingOperationRecord>  pending;
    std::unordered_map<int64_t, int64_t>              pending_by_copy;
    std::map<int64_t, model::OperationRecord>         operations;

    int64_t next_document_id  = 1;
    int64_t next_copy_id      = 1;
    int64_t next_pending_id   = 1;
    int64_t next_operation_id = 1;
  };

  // Nulls references to the copy, then erases it and its path index entry.
  static void EraseCopy(State& s, int64_t copy_id);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
