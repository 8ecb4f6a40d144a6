#pragma once

#include <memory>

namespace draftstore::core { class Directory; }
namespace draftstore::core { class ResourceRepository; }
namespace draftstore::core { class DraftsRepository; }
namespace draftstore::db { class Repository; }

namespace draftstore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<draftstore::db::Repository> repository;
  std::shared_ptr<draftstore::core::Directory> directory;
  std::shared_ptr<draftstore::core::ResourceRepository> resources;
  std::shared_ptr<draftstore::core::DraftsRepository> drafts;
};

}
