#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using calltrace::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "calltrace_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Throws(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\traces\\\"quoted\"\\run.db"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\traces\\\"quoted\"\\run.db");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  pattern: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  backend: memory
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
  assert(Throws("instrumentation:\n  runtime_prefix: [/usr]\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "calltrace_no_such_config.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDefaults() {
  const auto config = ConfigLoader::Defaults();
  assert(config.database().backend() == "sqlite");
  assert(config.database().sqlite().path().empty());
  assert(config.database().sqlite().directory() == "run_dbs");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.database().sqlite().wal_mode());
  assert(!config.instrumentation().project_root().empty());
  assert(!config.instrumentation().fallback_on_unreadable_source());
  assert(config.instrumentation().third_party_dirs_size() == 0);

  // an empty document is the same as no file
  const auto empty = ConfigLoader::LoadFromYamlString("");
  assert(empty.database().backend() == "sqlite");
  assert(empty.database().sqlite().directory() == "run_dbs");
}

void TestExplicitValuesSurviveDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: debug
database:
  backend: memory
  sqlite:
    directory: traces
    busy_timeout_ms: 250
    wal_mode: false
instrumentation:
  project_root: /srv/app
  fallback_on_unreadable_source: true
  third_party_dirs: [deps, extern]
  environment_marker_files: [.venv-marker]
)");

  assert(config.logging().level() == "debug");
  assert(config.database().backend() == "memory");
  assert(config.database().sqlite().directory() == "traces");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(!config.database().sqlite().wal_mode());
  assert(config.instrumentation().project_root() == "/srv/app");
  assert(config.instrumentation().fallback_on_unreadable_source());
  assert(config.instrumentation().third_party_dirs_size() == 2);
  assert(config.instrumentation().third_party_dirs(1) == "extern");
  assert(config.instrumentation().environment_marker_files(0) == ".venv-marker");
}

void TestUnknownBackendIsRejected() {
  assert(Throws("database:\n  backend: postgres\n"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestDefaults();
  TestExplicitValuesSurviveDefaults();
  TestUnknownBackendIsRejected();

  std::cout << "calltrace_unit_config_loader: pass\n";
  return 0;
}
