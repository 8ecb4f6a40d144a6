#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/dependency_rules.hpp"
#include "memory_tx.hpp"

namespace draftstore::db::memory {

using namespace draftstore::v1;

namespace {

bool HasLock(const std::vector<model::LockRecord>& locks, int64_t resource_id, ResourceLockType type) {
  return std::any_of(locks.begin(), locks.end(), [&](const model::LockRecord& l) {
    return l.resource_id == resource_id && l.lock_type == type;
  });
}

bool Matches(const model::DraftRecord& r, const DraftFilter& f) {
  if (f.draft_type == DraftType::kResource && r.resource_id.has_value()) return false;
  if (f.draft_type == DraftType::kModification && !r.resource_id.has_value()) return false;
  if (f.resource_type && r.resource_type != *f.resource_type) return false;
  if (f.user_id && r.user_id != *f.user_id) return false;
  if (f.exclude_user_id && r.user_id == *f.exclude_user_id) return false;
  if (f.group_id && r.group_id != *f.group_id) return false;
  if (f.resource_id && r.resource_id != f.resource_id) return false;
  if (f.base_resource_id && r.base_resource_id != f.base_resource_id) return false;
  return true;
}

// at most one modification per (user, resource)
bool ViolatesModificationUniqueness(const std::map<int64_t, model::DraftRecord>& drafts, const model::DraftRecord& r) {
  if (!r.resource_id.has_value()) return false;
  for (const auto& [id, other] : drafts) {
    if (id != r.draft_id && other.user_id == r.user_id && other.resource_id == r.resource_id) return true;
  }
  return false;
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
// Users / groups
// ------------------------------------------------------------------

Result MemoryRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, u] : s.users) {
    if (u.username == r.username) return Result::Err(ErrorCode::ConstraintViolation, "username taken");
  }
  if (r.user_id == 0) {
    r.user_id = s.next_user_id++;
  } else if (s.users.contains(r.user_id)) {
    return Result::Err(ErrorCode::AlreadyExists);
  } else {
    s.next_user_id = std::max(s.next_user_id, r.user_id + 1);
  }
  r.is_deleted       = false;
  s.users[r.user_id] = r;
  return Result::Ok();
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, int64_t user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(user_id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::LockUser(Transaction& t, int64_t user_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.users.find(user_id);
  if (it == s.users.end()) return Result::Err(ErrorCode::NotFound);
  it->second.is_deleted = true;
  return Result::Ok();
}

Result MemoryRepository::InsertGroup(Transaction& t, model::GroupRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, g] : s.groups) {
    if (g.name == r.name) return Result::Err(ErrorCode::ConstraintViolation, "group name taken");
  }
  if (r.group_id == 0) {
    r.group_id = s.next_group_id++;
  } else if (s.groups.contains(r.group_id)) {
    return Result::Err(ErrorCode::AlreadyExists);
  } else {
    s.next_group_id = std::max(s.next_group_id, r.group_id + 1);
  }
  r.is_deleted         = false;
  s.groups[r.group_id] = r;
  return Result::Ok();
}

std::optional<model::GroupRecord> MemoryRepository::GetGroup(Transaction& t, int64_t group_id) {
  const auto& s  = TX(t).View();
  auto        it = s.groups.find(group_id);
  if (it == s.groups.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::LockGroup(Transaction& t, int64_t group_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.groups.find(group_id);
  if (it == s.groups.end()) return Result::Err(ErrorCode::NotFound);
  it->second.is_deleted = true;
  return Result::Ok();
}

Result MemoryRepository::AddGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  auto& s = TX(t).Mutable();
  if (!s.groups.contains(group_id) || !s.users.contains(user_id)) return Result::Err(ErrorCode::NotFound);
  if (!s.members.emplace(group_id, user_id).second) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

Result MemoryRepository::RemoveGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  if (TX(t).Mutable().members.erase({group_id, user_id}) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

bool MemoryRepository::IsGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  return TX(t).View().members.contains({group_id, user_id});
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result MemoryRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.groups.contains(r.group_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown group");
  if (r.resource_id == 0) {
    r.resource_id = s.next_resource_id++;
  } else if (s.resources.contains(r.resource_id)) {
    return Result::Err(ErrorCode::AlreadyExists);
  } else {
    s.next_resource_id = std::max(s.next_resource_id, r.resource_id + 1);
  }
  r.latest_snapshot_id.reset();
  r.is_deleted               = false;
  r.is_readonly              = false;
  s.resources[r.resource_id] = r;
  return Result::Ok();
}

std::optional<model::ResourceRecord> MemoryRepository::GetResource(Transaction& t, int64_t resource_id) {
  const auto& s  = TX(t).View();
  auto        it = s.resources.find(resource_id);
  if (it == s.resources.end()) return std::nullopt;

  auto r        = it->second;
  r.is_deleted  = HasLock(s.locks, resource_id, RESOURCE_LOCK_TYPE_DELETE);
  r.is_readonly = HasLock(s.locks, resource_id, RESOURCE_LOCK_TYPE_READONLY);
  return r;
}

Result MemoryRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  res = s.resources.find(r.resource_id);
  if (res == s.resources.end()) return Result::Err(ErrorCode::NotFound, "unknown resource");

  if (r.snapshot_id == 0) {
    r.snapshot_id = s.next_snapshot_id++;
  } else if (s.snapshots.contains(r.snapshot_id)) {
    return Result::Err(ErrorCode::AlreadyExists);
  } else {
    s.next_snapshot_id = std::max(s.next_snapshot_id, r.snapshot_id + 1);
  }
  s.snapshots[r.snapshot_id]     = r;
  res->second.latest_snapshot_id = r.snapshot_id;
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction& t, int64_t snapshot_id) {
  const auto& s  = TX(t).View();
  auto        it = s.snapshots.find(snapshot_id);
  if (it == s.snapshots.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction& t, int64_t resource_id) {
  std::vector<model::SnapshotRecord> out;
  for (const auto& [_, snap] : TX(t).View().snapshots)
    if (snap.resource_id == resource_id) out.push_back(snap);
  return out;
}

Result MemoryRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.resources.contains(r.resource_id)) return Result::Err(ErrorCode::NotFound, "unknown resource");
  if (HasLock(s.locks, r.resource_id, r.lock_type)) return Result::Err(ErrorCode::AlreadyExists);
  s.locks.push_back(r);
  return Result::Ok();
}

std::vector<model::LockRecord> MemoryRepository::GetLocks(Transaction& t, int64_t resource_id) {
  std::vector<model::LockRecord> out;
  for (const auto& l : TX(t).View().locks)
    if (l.resource_id == resource_id) out.push_back(l);
  return out;
}

// ------------------------------------------------------------------
// Dependency rules / edges
// ------------------------------------------------------------------

Result MemoryRepository::InsertDependencyType(Transaction& t, const model::DependencyTypeRecord& r) {
  auto&      s      = TX(t).Mutable();
  const auto exists = std::any_of(s.dependency_types.begin(), s.dependency_types.end(), [&](const auto& d) {
    return d.parent_resource_type == r.parent_resource_type && d.child_resource_type == r.child_resource_type;
  });
  if (!exists) s.dependency_types.push_back(r);
  return Result::Ok();
}

std::vector<model::DependencyTypeRecord> MemoryRepository::ListDependencyTypes(Transaction& t) {
  return TX(t).View().dependency_types;
}

std::optional<ParentTypeCheck> MemoryRepository::CheckParentType(Transaction& t, int64_t parent_resource_id,
                                                                 ResourceType child_type) {
  const auto& s  = TX(t).View();
  auto        it = s.resources.find(parent_resource_id);
  if (it == s.resources.end()) return std::nullopt;

  std::vector<draftstore::model::DependencyRule> rules;
  rules.reserve(s.dependency_types.size());
  for (const auto& d : s.dependency_types) rules.push_back({d.parent_resource_type, d.child_resource_type});

  ParentTypeCheck check;
  check.is_deleted  = HasLock(s.locks, parent_resource_id, RESOURCE_LOCK_TYPE_DELETE);
  check.parent_type = it->second.resource_type;
  check.legal       = draftstore::model::IsLegalDependency(rules, check.parent_type, child_type);
  return check;
}

Result MemoryRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.resources.contains(r.parent_resource_id) || !s.resources.contains(r.child_resource_id)) {
    return Result::Err(ErrorCode::NotFound, "unknown resource");
  }
  for (const auto& d : s.dependencies) {
    if (d.parent_resource_id == r.parent_resource_id && d.child_resource_id == r.child_resource_id) {
      return Result::Err(ErrorCode::AlreadyExists);
    }
  }
  s.dependencies.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::DeleteDependency(Transaction& t, int64_t parent_resource_id, int64_t child_resource_id) {
  auto&      deps   = TX(t).Mutable().dependencies;
  const auto before = deps.size();
  std::erase_if(deps, [&](const model::DependencyRecord& d) {
    return d.parent_resource_id == parent_resource_id && d.child_resource_id == child_resource_id;
  });
  if (deps.size() == before) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DependencyRecord> MemoryRepository::GetChildren(Transaction& t, int64_t parent_resource_id) {
  std::vector<model::DependencyRecord> out;
  for (const auto& d : TX(t).View().dependencies)
    if (d.parent_resource_id == parent_resource_id) out.push_back(d);
  return out;
}

std::vector<model::DependencyRecord> MemoryRepository::GetParents(Transaction& t, int64_t child_resource_id) {
  std::vector<model::DependencyRecord> out;
  for (const auto& d : TX(t).View().dependencies)
    if (d.child_resource_id == child_resource_id) out.push_back(d);
  return out;
}

// ------------------------------------------------------------------
// Drafts
// ------------------------------------------------------------------

Result MemoryRepository::InsertDraft(Transaction& t, model::DraftRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.draft_id != 0 && s.drafts.contains(r.draft_id)) return Result::Err(ErrorCode::AlreadyExists);
  if (ViolatesModificationUniqueness(s.drafts, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "draft modification already exists for user and resource");
  }
  if (r.draft_id == 0) {
    r.draft_id = s.next_draft_id++;
  } else {
    s.next_draft_id = std::max(s.next_draft_id, r.draft_id + 1);
  }
  s.drafts[r.draft_id] = r;
  return Result::Ok();
}

std::optional<model::DraftRecord> MemoryRepository::GetDraft(Transaction& t, int64_t draft_id) {
  const auto& s  = TX(t).View();
  auto        it = s.drafts.find(draft_id);
  if (it == s.drafts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateDraft(Transaction& t, const model::DraftRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.drafts.contains(r.draft_id)) return Result::Err(ErrorCode::NotFound);
  if (ViolatesModificationUniqueness(s.drafts, r)) {
    return Result::Err(ErrorCode::ConstraintViolation, "draft modification already exists for user and resource");
  }
  s.drafts[r.draft_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteDraft(Transaction& t, int64_t draft_id) {
  if (TX(t).Mutable().drafts.erase(draft_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DraftRecord> MemoryRepository::FindDrafts(Transaction& t, const DraftFilter& filter,
                                                             const Pagination& page) {
  std::vector<model::DraftRecord> out;
  std::size_t                     skipped = 0;
  for (const auto& [_, r] : TX(t).View().drafts) {
    if (!Matches(r, filter)) continue;
    if (skipped < page.offset) {
      ++skipped;
      continue;
    }
    out.push_back(r);
    if (page.limit != 0 && out.size() >= page.limit) break;
  }
  return out;
}

uint64_t MemoryRepository::CountDrafts(Transaction& t, const DraftFilter& filter) {
  const auto& drafts = TX(t).View().drafts;
  return std::count_if(drafts.begin(), drafts.end(), [&](const auto& kv) { return Matches(kv.second, filter); });
}

std::vector<int64_t> MemoryRepository::ResourcesWithDraftModifications(Transaction& t,
                                                                       const std::vector<int64_t>& resource_ids,
                                                                       std::optional<int64_t> user_id) {
  const std::set<int64_t> wanted(resource_ids.begin(), resource_ids.end());
  std::set<int64_t>       found;
  for (const auto& [_, r] : TX(t).View().drafts) {
    if (!r.resource_id || !wanted.contains(*r.resource_id)) continue;
    if (user_id && r.user_id != *user_id) continue;
    found.insert(*r.resource_id);
  }
  return {found.begin(), found.end()};
}

} // namespace draftstore::db::memory
