#pragma once

#include <stdexcept>
#include <string>

namespace draftstore::util {

/*
  Central error types.

  Every precondition failure of the versioning layer surfaces as one of
  these. Callers switch on Kind() (or catch the concrete type) to build
  user-visible messages; nothing here is retryable.
*/

enum class ErrorKind {
  NotFound,
  Deleted,
  Membership,
  Duplicate,
  InvalidRelationship,
  ReadOnly,
  Malformed,
  InvalidState,
  Conflict,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// ---------------------------------------------------------------------
// Not-found
// ---------------------------------------------------------------------

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorKind::NotFound, msg) {
  }
};

class DraftDoesNotExist : public NotFound {
 public:
  explicit DraftDoesNotExist(const std::string& msg) : NotFound(msg) {
  }
};

// ---------------------------------------------------------------------
// Deleted-entity
// ---------------------------------------------------------------------

class EntityDeleted : public Error {
 public:
  explicit EntityDeleted(const std::string& msg) : Error(ErrorKind::Deleted, msg) {
  }
};

// ---------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------

class UserNotInGroup : public Error {
 public:
  explicit UserNotInGroup(const std::string& msg) : Error(ErrorKind::Membership, msg) {
  }
};

// ---------------------------------------------------------------------
// Duplicate
// ---------------------------------------------------------------------

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(ErrorKind::Duplicate, msg) {
  }
};

class DraftAlreadyExists : public AlreadyExists {
 public:
  explicit DraftAlreadyExists(const std::string& msg) : AlreadyExists(msg) {
  }
};

// ---------------------------------------------------------------------
// Invalid relationship
// ---------------------------------------------------------------------

class InvalidRelationship : public Error {
 public:
  explicit InvalidRelationship(const std::string& msg) : Error(ErrorKind::InvalidRelationship, msg) {
  }
};

// base resource type is not a legal parent of the draft's type
class DraftBaseInvalid : public InvalidRelationship {
 public:
  explicit DraftBaseInvalid(const std::string& msg) : InvalidRelationship(msg) {
  }
};

// snapshot belongs to another resource
class DraftSnapshotIdInvalid : public InvalidRelationship {
 public:
  explicit DraftSnapshotIdInvalid(const std::string& msg) : InvalidRelationship(msg) {
  }
};

class DraftTargetOwnerMismatch : public InvalidRelationship {
 public:
  explicit DraftTargetOwnerMismatch(const std::string& msg) : InvalidRelationship(msg) {
  }
};

// snapshot pointer change requested on a draft resource
class DraftModificationRequired : public InvalidRelationship {
 public:
  explicit DraftModificationRequired(const std::string& msg) : InvalidRelationship(msg) {
  }
};

// ---------------------------------------------------------------------
// State
// ---------------------------------------------------------------------

class ReadOnlyLock : public Error {
 public:
  explicit ReadOnlyLock(const std::string& msg) : Error(ErrorKind::ReadOnly, msg) {
  }
};

class MalformedDraft : public Error {
 public:
  explicit MalformedDraft(const std::string& msg) : Error(ErrorKind::Malformed, msg) {
  }
};

class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(ErrorKind::InvalidState, msg) {
  }
};

// draft modification re-pinned to an older snapshot
class InvalidDraftBaseSnapshot : public InvalidState {
 public:
  explicit InvalidDraftBaseSnapshot(const std::string& msg) : InvalidState(msg) {
  }
};

class Conflict : public Error {
 public:
  explicit Conflict(const std::string& msg) : Error(ErrorKind::Conflict, msg) {
  }
};

// pinned snapshot is no longer the resource's latest at commit time
class DraftCommitConflict : public Conflict {
 public:
  explicit DraftCommitConflict(const std::string& msg) : Conflict(msg) {
  }
};

inline const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::Deleted:
      return "deleted";
    case ErrorKind::Membership:
      return "membership";
    case ErrorKind::Duplicate:
      return "duplicate";
    case ErrorKind::InvalidRelationship:
      return "invalid_relationship";
    case ErrorKind::ReadOnly:
      return "read_only";
    case ErrorKind::Malformed:
      return "malformed";
    case ErrorKind::InvalidState:
      return "invalid_state";
    case ErrorKind::Conflict:
      return "conflict";
  }
  return "unknown";
}

} // namespace draftstore::util
