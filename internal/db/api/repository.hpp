#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/document_copy_record.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/model/pending_operation_record.hpp"

namespace docman::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id back into the passed record
  - Constraints hold for every backend:
      documents.content_hash unique
      document_copies(repository_path, file_path) unique
      pending_operations.document_copy_id unique
  - DeleteDocument cascades to the document's copies
  - DeleteCopy nulls document_copy_id on pending and historical operations

  The DB is the source of truth for:
    document identity
    copy locations and organization status
    pending suggestions and operation history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Documents
  // ---------------------------------------------------------------------

  virtual Result InsertDocument(Transaction&, model::DocumentRecord&) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) = 0;

  virtual std::optional<model::DocumentRecord> FindDocumentByHash(Transaction&, const std::string& content_hash) = 0;

  virtual Result UpdateDocument(Transaction&, const model::DocumentRecord&) = 0;

  virtual Result DeleteDocument(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Copies
  // ---------------------------------------------------------------------

  virtual Result InsertCopy(Transaction&, model::DocumentCopyRecord&) = 0;

  virtual std::optional<model::DocumentCopyRecord> GetCopy(Transaction&, int64_t id) = 0;

  virtual std::optional<model::DocumentCopyRecord> FindCopyByPath(Transaction&, const std::string& repository_path,
                                                                  const std::string& file_path) = 0;

  virtual Result UpdateCopy(Transaction&, const model::DocumentCopyRecord&) = 0;

  virtual Result DeleteCopy(Transaction&, int64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::DocumentCopyRecord> ListCopies(Transaction&, const std::string& repository_path) = 0;

  // Ordered by id, across all repositories.
  virtual std::vector<model::DocumentCopyRecord> ListCopiesForDocument(Transaction&, int64_t document_id) = 0;

  // ---------------------------------------------------------------------
  // Pending operations
  // ---------------------------------------------------------------------

  // Replaces any existing pending operation for the same copy.
  virtual Result UpsertPendingOperation(Transaction&, model::PendingOperationRecord&) = 0;

  virtual std::optional<model::PendingOperationRecord> GetPendingOperation(Transaction&, int64_t id) = 0;

  virtual std::optional<model::PendingOperationRecord> FindPendingOperationForCopy(Transaction&, int64_t copy_id) = 0;

  // Pending operations whose copy lives in repository_path, ordered by id.
  virtual std::vector<model::PendingOperationRecord> ListPendingOperations(Transaction&,
                                                                           const std::string& repository_path) = 0;

  virtual Result DeletePendingOperation(Transaction&, int64_t id) = 0;

  virtual Result DeletePendingOperationsForCopy(Transaction&, int64_t copy_id) = 0;

  // ---------------------------------------------------------------------
  // Operation history
  // ---------------------------------------------------------------------

  virtual Result InsertOperation(Transaction&, model::OperationRecord&) = 0;

  // Matches on original_repository_path so orphaned rows are included.
  virtual std::vector<model::OperationRecord> ListOperations(Transaction&, const std::string& repository_path) = 0;

  virtual std::vector<model::OperationRecord> ListOperationsForCopy(Transaction&, int64_t copy_id) = 0;
};

} // namespace docman::db
