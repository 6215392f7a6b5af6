#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/cache/content_cache.hpp"
#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "graphflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
cache:
  sqlite:
    path: "C:\\graphflow\\\"quoted\"\\cache.db"
    wal_mode: true
engine:
  max_work_items: 500
logging:
  level: debug
observability:
  service_name: graphflow-test
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = graphflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.cache().sqlite().path() == "C:\\graphflow\\\"quoted\"\\cache.db");
  assert(config.cache().sqlite().wal_mode());
  assert(config.engine().max_work_items() == 500);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == graphflow::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestDefaultsFillMissingSections() {
  auto config = graphflow::config::ConfigLoader::LoadFromYamlString("logging:\n  level: info\n");
  assert(config.server().bind_address() == graphflow::config::kDefaultBindAddress);
  assert(config.cache().has_memory());
  assert(config.engine().max_work_items() == graphflow::config::kDefaultMaxWorkItems);
  assert(config.observability().service_name() == "graphflow");

  auto empty = graphflow::config::ConfigLoader::LoadFromYamlString("");
  assert(empty.cache().has_memory());
}

void TestZeroWorkItemsSelectsDefault() {
  auto config = graphflow::config::ConfigLoader::LoadFromYamlString("engine:\n  max_work_items: 0\ncache:\n  disabled: {}\n");
  assert(config.engine().max_work_items() == graphflow::config::kDefaultMaxWorkItems);
  assert(config.cache().has_disabled());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)graphflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)graphflow::config::ConfigLoader::LoadFromYaml("/nonexistent/graphflow.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFactorySelectsCacheBackend() {
  auto disabled = graphflow::config::ConfigLoader::LoadFromYamlString("cache:\n  disabled: {}\n");
  assert(std::string(graphflow::factory::BuildCache(disabled)->Name()) == "disabled");

  auto memory = graphflow::config::ConfigLoader::LoadFromYamlString("");
  assert(std::string(graphflow::factory::BuildCache(memory)->Name()) == "memory");

#if GRAPHFLOW_CACHE_SQLITE

  const auto db_path = std::filesystem::temp_directory_path() / "graphflow_config_loader_tests" / "factory-cache.db";
  std::filesystem::create_directories(db_path.parent_path());
  auto sqlite = graphflow::config::ConfigLoader::LoadFromYamlString("cache:\n  sqlite:\n    path: \"" + db_path.string() + "\"\n");
  assert(std::string(graphflow::factory::BuildCache(sqlite)->Name()) == "sqlite");
#endif
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsFillMissingSections();
  TestZeroWorkItemsSelectsDefault();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestFactorySelectsCacheBackend();

  std::cout << "graphflow_unit_config_loader: pass\n";
  return 0;
}
