#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/core/directory.hpp"
#include "internal/core/drafts_repository.hpp"
#include "internal/core/resource_repository.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/dependency_rules.hpp"
#include "internal/service/draft_service.hpp"
#include "internal/service/resource_service.hpp"

namespace draftstore::factory {

/*
  Application

  Owns the store and everything built on top of it.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::Directory>          directory;
  std::shared_ptr<core::ResourceRepository> resources;
  std::shared_ptr<core::DraftsRepository>   drafts;

  std::shared_ptr<service::DraftService>    draft_service;
  std::shared_ptr<service::ResourceService> resource_service;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema. Memory is the
  default when no backend is configured.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const draftstore::runtime::config::RuntimeConfig& config);

// Inserts any missing (parent, child) rule rows. Idempotent.
void SeedDependencyRules(db::Repository& repository, const std::vector<model::DependencyRule>& rules);

Application Build(const draftstore::runtime::config::RuntimeConfig& config);

// Wires the layers over an existing store (tests share one store across builds).
Application Build(std::shared_ptr<db::Repository> repository, const std::vector<model::DependencyRule>& rules);

} // namespace draftstore::factory
