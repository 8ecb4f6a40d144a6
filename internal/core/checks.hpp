#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace draftstore::core {

/*
  Entity / invariant helpers shared by the repositories.

  The *Exists functions only look; the Assert* functions throw the
  matching util::Error subclass. All of them run inside the caller's
  transaction and never write.
*/

enum class ExistenceResult {
  DoesNotExist,
  Exists,
  Deleted,
};

enum class DeletionPolicy {
  Any,
  NotDeleted,
  Deleted,
};

const char* DeletionPolicyName(DeletionPolicy policy);

ExistenceResult UserExists(db::Repository& repo, db::Transaction& tx, int64_t user_id);
ExistenceResult GroupExists(db::Repository& repo, db::Transaction& tx, int64_t group_id);
ExistenceResult ResourceExists(db::Repository& repo, db::Transaction& tx, int64_t resource_id);

bool SnapshotExists(db::Repository& repo, db::Transaction& tx, int64_t snapshot_id);
bool DraftExists(db::Repository& repo, db::Transaction& tx, int64_t draft_id);

// False for read-only (and for missing) resources.
bool ResourceModifiable(db::Repository& repo, db::Transaction& tx, int64_t resource_id);

// DoesNotExist -> NotFound. Under NotDeleted a tombstone is EntityDeleted;
// under Deleted a live entity is AlreadyExists.
void AssertUserExists(db::Repository& repo, db::Transaction& tx, int64_t user_id, DeletionPolicy policy);
void AssertGroupExists(db::Repository& repo, db::Transaction& tx, int64_t group_id, DeletionPolicy policy);
void AssertResourceExists(db::Repository& repo, db::Transaction& tx, int64_t resource_id, DeletionPolicy policy);

void AssertSnapshotExists(db::Repository& repo, db::Transaction& tx, int64_t snapshot_id);
void AssertDraftExists(db::Repository& repo, db::Transaction& tx, int64_t draft_id);

// No-op for draft_id 0 (not yet persisted).
void AssertDraftDoesNotExist(db::Repository& repo, db::Transaction& tx, int64_t draft_id);

void AssertUserInGroup(db::Repository& repo, db::Transaction& tx, int64_t user_id, int64_t group_id);
void AssertResourceModifiable(db::Repository& repo, db::Transaction& tx, int64_t resource_id);

// Converts a failed store Result into the matching util::Error.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace draftstore::core
