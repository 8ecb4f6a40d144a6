#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/dependency_rules.hpp"

namespace {

using draftstore::config::ConfigLoader;
using draftstore::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "draftstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestSqliteFileConfig() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\drafts\\\"quoted\"\\db.sqlite"
    wal_mode: true
    busy_timeout_ms: 250
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "C:\\drafts\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 250);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/draftstore.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEnvironmentOverridesSqlitePath() {
  setenv("DRAFTSTORE_SQLITE_PATH", "/tmp/override.db", 1);
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: /var/lib/draftstore/draftstore.db
)");
  unsetenv("DRAFTSTORE_SQLITE_PATH");

  assert(config.database().sqlite().path() == "/tmp/override.db");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("logging:\n  level: chatty\n"));
  assert(Rejects(R"(versioning:
  dependency_rules:
    - { parent: experiment, child: spaceship }
)"));
  assert(Rejects("database: [1, 2\n"));

  assert(!Rejects("logging:\n  level: off\n"));
}

void TestDependencyRulesDefaultAndConfigured() {
  auto defaults = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(defaults.database().backend_case() == DatabaseConfig::kMemory);
  assert(ConfigLoader::DependencyRules(defaults) == draftstore::model::DefaultDependencyRules());

  auto custom = ConfigLoader::LoadFromYamlString(R"(versioning:
  dependency_rules:
    - { parent: experiment, child: job }
)");
  const auto rules = ConfigLoader::DependencyRules(custom);
  assert(rules.size() == 1);
  assert(rules.front().parent == draftstore::v1::RESOURCE_TYPE_EXPERIMENT);
  assert(rules.front().child == draftstore::v1::RESOURCE_TYPE_JOB);
  assert(draftstore::model::IsLegalDependency(rules, draftstore::v1::RESOURCE_TYPE_EXPERIMENT,
                                              draftstore::v1::RESOURCE_TYPE_JOB));
}

} // namespace

int main() {
  TestSqliteFileConfig();
  TestMissingFileIsReported();
  TestEnvironmentOverridesSqlitePath();
  TestInvalidConfigsAreRejected();
  TestDependencyRulesDefaultAndConfigured();

  std::cout << "draftstore_unit_config_loader: pass\n";
  return 0;
}
