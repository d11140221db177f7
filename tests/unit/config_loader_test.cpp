#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using stockroom::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stockroom_config_loader_tests";
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

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().has_memory());
  assert(config.tenant().tenant_id() == "default");
  assert(config.tenant().actor_name() == "operator");
  assert(config.inventory().default_low_stock_threshold() == 5);
  assert(config.inventory().restored_category_name() == "Restored");
  assert(config.logging().level() == "info");
}

void TestSqliteFromFile() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(database:
  sqlite:
    path: "/var/lib/stockroom/shop.db"
    wal_mode: true
tenant:
  tenant_id: "shop-7"
  actor_id: "u-1"
  actor_name: "Sam"
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/stockroom/shop.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.tenant().tenant_id() == "shop-7");
  assert(config.tenant().actor_name() == "Sam");
}

void TestPostgresPoolSizeDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://stockroom@db/stockroom"
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://stockroom@db/stockroom");
  assert(config.database().postgres().max_connections() == 8);
}

void TestExplicitZeroThresholdIsKept() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(inventory:
  default_low_stock_threshold: 0
  restored_category_name: "Recovered"
)");
  assert(config.inventory().has_default_low_stock_threshold());
  assert(config.inventory().default_low_stock_threshold() == 0);
  assert(config.inventory().restored_category_name() == "Recovered");
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(tenant:
  tenant_id: "0042"
  actor_name: "C:\\till\\\"front\""
)");
  assert(config.tenant().tenant_id() == "0042");
  assert(config.tenant().actor_name() == "C:\\till\\\"front\"");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("inventory:\n  default_low_stock_threshold: -1\n"));
  assert(Rejects("logging:\n  level: loud\n"));
  assert(Rejects("- not\n- a\n- mapping\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/stockroom.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "missing config file must be reported");
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestSqliteFromFile();
  TestPostgresPoolSizeDefaults();
  TestExplicitZeroThresholdIsKept();
  TestQuotedScalarsStayStrings();
  TestInvalidConfigsAreRejected();

  std::cout << "stockroom_unit_config_loader: pass\n";
  return 0;
}
