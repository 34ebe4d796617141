#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace docman::db::memory {

namespace {

std::string CopyPathKey(const std::string& repository_path, const std::string& file_path) {
  return repository_path + '\0' + file_path;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result MemoryRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.document_by_hash.contains(r.content_hash)) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: documents.content_hash");
  }

  r.id = s.next_document_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  s.documents[r.id]                 = r;
  s.document_by_hash[r.content_hash] = r.id;
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DocumentRecord> MemoryRepository::FindDocumentByHash(Transaction& t, const std::string& content_hash) {
  const auto& s  = TX(t).View();
  auto        it = s.document_by_hash.find(content_hash);
  if (it == s.document_by_hash.end()) return std::nullopt;
  return s.documents.at(it->second);
}

Result MemoryRepository::UpdateDocument(Transaction& t, const model::DocumentRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.documents.find(r.id);
  if (it == s.documents.end()) return Result::Err(ErrorCode::NotFound);

  if (it->second.content_hash != r.content_hash) {
    if (s.document_by_hash.contains(r.content_hash)) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: documents.content_hash");
    }
    s.document_by_hash.erase(it->second.content_hash);
    s.document_by_hash[r.content_hash] = r.id;
  }

  it->second               = r;
  it->second.updated_at_ms = util::NowMs();
  return Result::Ok();
}

Result MemoryRepository::DeleteDocument(Transaction& t, int64_t id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.documents.find(id);
  if (it == s.documents.end()) return Result::Ok();

  std::vector<int64_t> owned;
  for (const auto& [copy_id, copy] : s.copies) {
    if (copy.document_id == id) owned.push_back(copy_id);
  }
  for (auto copy_id : owned) {
    EraseCopy(s, copy_id);
  }

  s.document_by_hash.erase(it->second.content_hash);
  s.documents.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Copies
// ------------------------------------------------------------------

Result MemoryRepository::InsertCopy(Transaction& t, model::DocumentCopyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.documents.contains(r.document_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: document_copies.document_id");
  }

  const auto key = CopyPathKey(r.repository_path, r.file_path);
  if (s.copy_by_path.contains(key)) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       "UNIQUE constraint failed: document_copies.repository_path, document_copies.file_path");
  }

  r.id = s.next_copy_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  s.copies[r.id]      = r;
  s.copy_by_path[key] = r.id;
  return Result::Ok();
}

std::optional<model::DocumentCopyRecord> MemoryRepository::GetCopy(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.copies.find(id);
  if (it == s.copies.end()) return std::nullopt;
  return it->second;
}

std::optional<model::DocumentCopyRecord> MemoryRepository::FindCopyByPath(Transaction& t, const std::string& repository_path,
                                                                          const std::string& file_path) {
  const auto& s  = TX(t).View();
  auto        it = s.copy_by_path.find(CopyPathKey(repository_path, file_path));
  if (it == s.copy_by_path.end()) return std::nullopt;
  return s.copies.at(it->second);
}

Result MemoryRepository::UpdateCopy(Transaction& t, const model::DocumentCopyRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.copies.find(r.id);
  if (it == s.copies.end()) return Result::Err(ErrorCode::NotFound);
  if (!s.documents.contains(r.document_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: document_copies.document_id");
  }

  const auto old_key = CopyPathKey(it->second.repository_path, it->second.file_path);
  const auto new_key = CopyPathKey(r.repository_path, r.file_path);
  if (old_key != new_key) {
    if (s.copy_by_path.contains(new_key)) {
      return Result::Err(ErrorCode::ConstraintViolation,
                         "UNIQUE constraint failed: document_copies.repository_path, document_copies.file_path");
    }
    s.copy_by_path.erase(old_key);
    s.copy_by_path[new_key] = r.id;
  }

  it->second               = r;
  it->second.updated_at_ms = util::NowMs();
  return Result::Ok();
}

void MemoryRepository::EraseCopy(State& s, int64_t copy_id) {
  auto it = s.copies.find(copy_id);
  if (it == s.copies.end()) return;

  auto pending_it = s.pending_by_copy.find(copy_id);
  if (pending_it != s.pending_by_copy.end()) {
    s.pending[pending_it->second].document_copy_id.reset();
    s.pending_by_copy.erase(pending_it);
  }
  for (auto& [_, op] : s.operations) {
    if (op.document_copy_id == copy_id) op.document_copy_id.reset();
  }

  s.copy_by_path.erase(CopyPathKey(it->second.repository_path, it->second.file_path));
  s.copies.erase(it);
}

Result MemoryRepository::DeleteCopy(Transaction& t, int64_t id) {
  EraseCopy(TX(t).Mutable(), id);
  return Result::Ok();
}

std::vector<model::DocumentCopyRecord> MemoryRepository::ListCopies(Transaction& t, const std::string& repository_path) {
  std::vector<model::DocumentCopyRecord> out;
  for (const auto& [_, copy] : TX(t).View().copies) {
    if (copy.repository_path == repository_path) out.push_back(copy);
  }
  return out;
}

std::vector<model::DocumentCopyRecord> MemoryRepository::ListCopiesForDocument(Transaction& t, int64_t document_id) {
  std::vector<model::DocumentCopyRecord> out;
  for (const auto& [_, copy] : TX(t).View().copies) {
    if (copy.document_id == document_id) out.push_back(copy);
  }
  return out;
}

// ------------------------------------------------------------------
// Pending operations
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPendingOperation(Transaction& t, model::PendingOperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!r.document_copy_id || !s.copies.contains(*r.document_copy_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: pending_operations.document_copy_id");
  }

  auto existing = s.pending_by_copy.find(*r.document_copy_id);
  if (existing != s.pending_by_copy.end()) {
    s.pending.erase(existing->second);
    s.pending_by_copy.erase(existing);
  }

  r.id = s.next_pending_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();

  s.pending[r.id]                        = r;
  s.pending_by_copy[*r.document_copy_id] = r.id;
  return Result::Ok();
}

std::optional<model::PendingOperationRecord> MemoryRepository::GetPendingOperation(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending.find(id);
  if (it == s.pending.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PendingOperationRecord> MemoryRepository::FindPendingOperationForCopy(Transaction& t, int64_t copy_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending_by_copy.find(copy_id);
  if (it == s.pending_by_copy.end()) return std::nullopt;
  return s.pending.at(it->second);
}

std::vector<model::PendingOperationRecord> MemoryRepository::ListPendingOperations(Transaction& t,
                                                                                   const std::string& repository_path) {
  const auto&                                s = TX(t).View();
  std::vector<model::PendingOperationRecord> out;
  for (const auto& [_, op] : s.pending) {
    if (!op.document_copy_id) continue;
    auto copy = s.copies.find(*op.document_copy_id);
    if (copy != s.copies.end() && copy->second.repository_path == repository_path) out.push_back(op);
  }
  return out;
}

Result MemoryRepository::DeletePendingOperation(Transaction& t, int64_t id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pending.find(id);
  if (it == s.pending.end()) return Result::Ok();
  if (it->second.document_copy_id) s.pending_by_copy.erase(*it->second.document_copy_id);
  s.pending.erase(it);
  return Result::Ok();
}

Result MemoryRepository::DeletePendingOperationsForCopy(Transaction& t, int64_t copy_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pending_by_copy.find(copy_id);
  if (it == s.pending_by_copy.end()) return Result::Ok();
  s.pending.erase(it->second);
  s.pending_by_copy.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Operation history
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.document_copy_id && !s.copies.contains(*r.document_copy_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: operations.document_copy_id");
  }

  r.id = s.next_operation_id++;
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  s.operations[r.id] = r;
  return Result::Ok();
}

std::vector<model::OperationRecord> MemoryRepository::ListOperations(Transaction& t, const std::string& repository_path) {
  std::vector<model::OperationRecord> out;
  for (const auto& [_, op] : TX(t).View().operations) {
    if (op.original_repository_path == repository_path) out.push_back(op);
  }
  return out;
}

std::vector<model::OperationRecord> MemoryRepository::ListOperationsForCopy(Transaction& t, int64_t copy_id) {
  std::vector<model::OperationRecord> out;
  for (const auto& [_, op] : TX(t).View().operations) {
    if (op.document_copy_id == copy_id) out.push_back(op);
  }
  return out;
}

} // namespace docman::db::memory
