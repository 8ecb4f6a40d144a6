#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/codec/draft_codec.hpp"
#include "internal/factory.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/transaction_scope.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using draftstore::factory::Application;
namespace dm = draftstore::model;

static void Usage() {
  std::cout << "Usage:\n"
            << "  draftctl --config <file> init\n"
            << "  draftctl --config <file> user add <name>\n"
            << "  draftctl --config <file> group add <name> <creator_id>\n"
            << "  draftctl --config <file> group join <group_id> <user_id>\n"
            << "  draftctl --config <file> resource create <type> <group_id> <user_id> <json>\n"
            << "  draftctl --config <file> resource delete <resource_id>\n"
            << "  draftctl --config <file> resource history <resource_id>\n"
            << "  draftctl --config <file> draft create <user_id> <type> <group_id> <json> [base_resource_id]\n"
            << "  draftctl --config <file> draft modify <user_id> <type> <resource_id> <json>\n"
            << "  draftctl --config <file> draft list <user_id> <type> [resource|modification|any]\n"
            << "  draftctl --config <file> draft show <draft_id>\n"
            << "  draftctl --config <file> draft commit <user_id> <draft_id>\n"
            << "  draftctl --config <file> draft discard <user_id> <draft_id>\n";
}

static dm::ResourceType ParseType(const std::string& value) {
  auto parsed = dm::ParseResourceTypeTag(value);
  if (!parsed.has_value()) {
    throw std::invalid_argument("unsupported resource type: " + value);
  }
  return parsed.value();
}

static std::optional<draftstore::db::DraftType> ParseDraftType(const std::string& value) {
  if (value == "any") return draftstore::db::DraftType::kAny;
  if (value == "resource") return draftstore::db::DraftType::kResource;
  if (value == "modification") return draftstore::db::DraftType::kModification;
  return std::nullopt;
}

static void PrintDraft(const dm::Draft& draft) {
  std::cout << "draft_id=" << draft.draft_id << " type=" << dm::ResourceTypeTag(draft.resource_type)
            << " group_id=" << draft.target_owner_group_id << " user_id=" << draft.creator_id
            << " last_modified_ms=" << draftstore::util::ToUnixMillis(draft.last_modified_on)
            << " payload=" << draftstore::db::codec::EncodeDraftPayload(draft.payload) << "\n";
}

static int Run(Application& app, const std::vector<std::string>& args) {
  const auto& group = args[0];
  const auto  n     = args.size();

  // ------------------------------------------------------------

  if (group == "init") {
    std::cout << "initialized\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (group == "user" && n == 3 && args[1] == "add") {
    auto user = app.resource_service->CreateUser(args[2]);
    std::cout << "user_id=" << user.user_id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (group == "group" && n == 4 && args[1] == "add") {
    auto created = app.resource_service->CreateGroup(args[2], std::stoll(args[3]));
    std::cout << "group_id=" << created.group_id << "\n";
    return 0;
  }

  if (group == "group" && n == 4 && args[1] == "join") {
    app.resource_service->JoinGroup(std::stoll(args[2]), std::stoll(args[3]));
    std::cout << "joined\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (group == "resource" && n == 6 && args[1] == "create") {
    auto created = app.resource_service->CreateResource(ParseType(args[2]), std::stoll(args[3]), std::stoll(args[4]),
                                                        draftstore::db::codec::DecodeResourceData(args[5]));
    std::cout << "resource_id=" << created.resource.resource_id << " snapshot_id=" << created.snapshot.snapshot_id
              << "\n";
    return 0;
  }

  if (group == "resource" && n == 3 && args[1] == "delete") {
    app.resource_service->DeleteResource(std::stoll(args[2]));
    std::cout << "deleted\n";
    return 0;
  }

  if (group == "resource" && n == 3 && args[1] == "history") {
    for (const auto& snapshot : app.resource_service->GetHistory(std::stoll(args[2]))) {
      std::cout << "snapshot_id=" << snapshot.snapshot_id << " user_id=" << snapshot.user_id
                << " created_on_ms=" << snapshot.created_on_ms << " data=" << snapshot.data << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (group == "draft" && (n == 6 || n == 7) && args[1] == "create") {
    std::optional<int64_t> base;
    if (n == 7) base = std::stoll(args[6]);
    auto draft = app.draft_service->CreateDraft(std::stoll(args[2]), ParseType(args[3]), std::stoll(args[4]), base,
                                                draftstore::db::codec::DecodeResourceData(args[5]));
    PrintDraft(draft);
    return 0;
  }

  if (group == "draft" && n == 6 && args[1] == "modify") {
    auto created = app.draft_service->CreateModification(std::stoll(args[2]), ParseType(args[3]), std::stoll(args[4]),
                                                         draftstore::db::codec::DecodeResourceData(args[5]));
    PrintDraft(created.draft);
    if (created.num_other_drafts > 0) {
      std::cout << "other_pending_drafts=" << created.num_other_drafts << "\n";
    }
    return 0;
  }

  if (group == "draft" && (n == 4 || n == 5) && args[1] == "list") {
    auto draft_type = ParseDraftType(n == 5 ? args[4] : "any");
    if (!draft_type.has_value()) {
      std::cerr << "unsupported draft type: " << args[4] << "\n";
      return 1;
    }
    auto page = app.draft_service->ListDrafts(std::stoll(args[2]), ParseType(args[3]), *draft_type);
    for (const auto& draft : page.drafts) PrintDraft(draft);
    std::cout << "total=" << page.total << "\n";
    return 0;
  }

  if (group == "draft" && n == 3 && args[1] == "show") {
    const auto draft_id = std::stoll(args[2]);
    auto draft = draftstore::service::RunInTransaction(*app.repository, "draftctl.show", [&](draftstore::db::Transaction& tx) {
      return app.drafts->GetOne(tx, draft_id);
    });
    PrintDraft(draft);
    return 0;
  }

  if (group == "draft" && n == 4 && args[1] == "commit") {
    auto committed = app.draft_service->CommitDraft(std::stoll(args[2]), std::stoll(args[3]));
    std::cout << "resource_id=" << committed.resource.resource_id << " snapshot_id=" << committed.snapshot.snapshot_id
              << "\n";
    return 0;
  }

  if (group == "draft" && n == 4 && args[1] == "discard") {
    app.draft_service->DeleteDraft(std::stoll(args[2]), std::stoll(args[3]));
    std::cout << "discarded\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = draftstore::config::ConfigLoader::LoadFromYaml(config_path);
    draftstore::observability::InitializeLogging(config);

    auto app  = draftstore::factory::Build(config);
    int  code = Run(app, args);

    draftstore::observability::ShutdownLogging();
    return code;
  } catch (const draftstore::util::Error& e) {
    std::cerr << draftstore::util::ErrorKindName(e.Kind()) << ": " << e.what() << "\n";
    draftstore::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    draftstore::observability::ShutdownLogging();
    return 2;
  }
}
