#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_defaults.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ito_audit_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "%v"
audit:
  enabled: false
  state_dir: ".ito-alt"
  log_relative_path: "audit/log.jsonl"
  fail_on_append_error: false
stream:
  poll_interval_ms: 250
  last: 3
  all_worktrees: true
reconcile:
  orphan_entities: [task, change]
)");

  auto config = ito::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.audit().has_enabled() && !config.audit().enabled());
  assert(config.audit().state_dir() == ".ito-alt");
  assert(config.audit().log_relative_path() == "audit/log.jsonl");
  assert(!config.audit().fail_on_append_error());
  assert(config.stream().poll_interval_ms() == 250);
  assert(config.stream().last() == 3);
  assert(config.stream().all_worktrees());
  assert(config.reconcile().orphan_entities_size() == 2);
  assert(config.reconcile().orphan_entities(1) == "change");
}

void TestMissingSectionsFallBackToDefaults() {
  auto config = ito::config::ConfigLoader::LoadFromYamlString("logging:\n  level: info\n");

  assert(config.audit().enabled());
  assert(config.audit().fail_on_append_error());
  assert(config.audit().state_dir() == ito::config::kDefaultStateDir);
  assert(config.audit().log_relative_path() == ito::config::kDefaultLogRelativePath);
  assert(config.stream().poll_interval_ms() == ito::config::kDefaultPollIntervalMs);
  assert(config.stream().last() == ito::config::kDefaultStreamLast);
  assert(!config.stream().all_worktrees());
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = ito::config::ConfigLoader::LoadFromYamlString("");
  assert(config.audit().enabled());
  assert(config.stream().last() == ito::config::kDefaultStreamLast);
}

void TestQuotedScalarsStayStrings() {
  auto config = ito::config::ConfigLoader::LoadFromYamlString("audit:\n  state_dir: \"123\"\n");
  assert(config.audit().state_dir() == "123");
}

void TestScalarEscapingForBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(audit:
  state_dir: "C:\\ito\\\"quoted\"\\state"
)");

  auto config = ito::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.audit().state_dir() == "C:\\ito\\\"quoted\"\\state");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(audit:
  enabled: true
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ito::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)ito::config::ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ito::config::ConfigLoader::LoadFromYaml("/nonexistent/ito-audit.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestMissingSectionsFallBackToDefaults();
  TestEmptyDocumentIsAllDefaults();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForBackslashValues();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestMissingFileThrows();

  std::cout << "ito_audit_unit_config_loader: pass\n";
  return 0;
}
