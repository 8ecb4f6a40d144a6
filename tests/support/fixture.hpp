#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "internal/db/codec/draft_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/model/dependency_rules.hpp"
#include "internal/service/transaction_scope.hpp"

namespace draftstore::testing {

inline google::protobuf::Struct Data(const std::string& json) {
  return db::codec::DecodeResourceData(json);
}

// True if fn throws E. Any other exception escapes and fails the test.
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

/*
  A fully wired application over one store, plus shortcuts for the
  directory and resource setup most tests need.
*/
struct World {
  factory::Application app;

  explicit World(std::shared_ptr<db::Repository> repository = std::make_shared<db::memory::MemoryRepository>())
      : app(factory::Build(std::move(repository), model::DefaultDependencyRules())) {
  }

  db::Repository& Repo() {
    return *app.repository;
  }

  int64_t User(const std::string& name) {
    return app.resource_service->CreateUser(name).user_id;
  }

  int64_t Group(const std::string& name, int64_t creator_id) {
    return app.resource_service->CreateGroup(name, creator_id).group_id;
  }

  // Runs fn(tx) against the core layer and commits.
  template <typename Fn>
  auto InTx(Fn&& fn) {
    return service::RunInTransaction(Repo(), "test", std::forward<Fn>(fn));
  }

  void Join(int64_t group_id, int64_t user_id) {
    app.resource_service->JoinGroup(group_id, user_id);
  }

  core::ResourceRepository::Created Resource(model::ResourceType type, int64_t group_id, int64_t user_id,
                                             const std::string& json = "{}") {
    return app.resource_service->CreateResource(type, group_id, user_id, Data(json));
  }
};

} // namespace draftstore::testing
