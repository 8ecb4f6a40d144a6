#include "checks.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace draftstore::core {

namespace {

std::string Describe(const char* entity, int64_t id) {
  return std::string(entity) + " " + std::to_string(id);
}

void ApplyPolicy(ExistenceResult existence, DeletionPolicy policy, const char* entity, int64_t id) {
  switch (existence) {
    case ExistenceResult::DoesNotExist:
      throw util::NotFound(Describe(entity, id) + " does not exist");
    case ExistenceResult::Deleted:
      if (policy == DeletionPolicy::NotDeleted) {
        throw util::EntityDeleted(Describe(entity, id) + " is deleted");
      }
      return;
    case ExistenceResult::Exists:
      if (policy == DeletionPolicy::Deleted) {
        throw util::AlreadyExists(Describe(entity, id) + " exists and is not deleted");
      }
      return;
  }
}

} // namespace

const char* DeletionPolicyName(DeletionPolicy policy) {
  switch (policy) {
    case DeletionPolicy::Any:
      return "any";
    case DeletionPolicy::NotDeleted:
      return "not_deleted";
    case DeletionPolicy::Deleted:
      return "deleted";
  }
  return "unknown";
}

ExistenceResult UserExists(db::Repository& repo, db::Transaction& tx, int64_t user_id) {
  auto user = repo.GetUser(tx, user_id);
  if (!user) return ExistenceResult::DoesNotExist;
  return user->is_deleted ? ExistenceResult::Deleted : ExistenceResult::Exists;
}

ExistenceResult GroupExists(db::Repository& repo, db::Transaction& tx, int64_t group_id) {
  auto group = repo.GetGroup(tx, group_id);
  if (!group) return ExistenceResult::DoesNotExist;
  return group->is_deleted ? ExistenceResult::Deleted : ExistenceResult::Exists;
}

ExistenceResult ResourceExists(db::Repository& repo, db::Transaction& tx, int64_t resource_id) {
  auto resource = repo.GetResource(tx, resource_id);
  if (!resource) return ExistenceResult::DoesNotExist;
  return resource->is_deleted ? ExistenceResult::Deleted : ExistenceResult::Exists;
}

bool SnapshotExists(db::Repository& repo, db::Transaction& tx, int64_t snapshot_id) {
  return repo.GetSnapshot(tx, snapshot_id).has_value();
}

bool DraftExists(db::Repository& repo, db::Transaction& tx, int64_t draft_id) {
  return repo.GetDraft(tx, draft_id).has_value();
}

bool ResourceModifiable(db::Repository& repo, db::Transaction& tx, int64_t resource_id) {
  auto resource = repo.GetResource(tx, resource_id);
  return resource && !resource->is_readonly;
}

void AssertUserExists(db::Repository& repo, db::Transaction& tx, int64_t user_id, DeletionPolicy policy) {
  ApplyPolicy(UserExists(repo, tx, user_id), policy, "user", user_id);
}

void AssertGroupExists(db::Repository& repo, db::Transaction& tx, int64_t group_id, DeletionPolicy policy) {
  ApplyPolicy(GroupExists(repo, tx, group_id), policy, "group", group_id);
}

void AssertResourceExists(db::Repository& repo, db::Transaction& tx, int64_t resource_id, DeletionPolicy policy) {
  ApplyPolicy(ResourceExists(repo, tx, resource_id), policy, "resource", resource_id);
}

void AssertSnapshotExists(db::Repository& repo, db::Transaction& tx, int64_t snapshot_id) {
  if (!SnapshotExists(repo, tx, snapshot_id)) {
    throw util::NotFound(Describe("snapshot", snapshot_id) + " does not exist");
  }
}

void AssertDraftExists(db::Repository& repo, db::Transaction& tx, int64_t draft_id) {
  if (!DraftExists(repo, tx, draft_id)) {
    throw util::DraftDoesNotExist(Describe("draft", draft_id) + " does not exist");
  }
}

void AssertDraftDoesNotExist(db::Repository& repo, db::Transaction& tx, int64_t draft_id) {
  if (draft_id != 0 && DraftExists(repo, tx, draft_id)) {
    throw util::DraftAlreadyExists(Describe("draft", draft_id) + " already exists");
  }
}

void AssertUserInGroup(db::Repository& repo, db::Transaction& tx, int64_t user_id, int64_t group_id) {
  if (!repo.IsGroupMember(tx, group_id, user_id)) {
    throw util::UserNotInGroup(Describe("user", user_id) + " is not a member of " + Describe("group", group_id));
  }
}

void AssertResourceModifiable(db::Repository& repo, db::Transaction& tx, int64_t resource_id) {
  auto resource = repo.GetResource(tx, resource_id);
  if (!resource) {
    throw util::NotFound(Describe("resource", resource_id) + " does not exist");
  }
  if (resource->is_readonly) {
    throw util::ReadOnlyLock(Describe("resource", resource_id) + " is read-only");
  }
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace draftstore::core
