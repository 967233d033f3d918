#include <filesystem>
#include <stdexcept>
#include <iostream>
#include <string>
#include <system_error>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/trace_dumper.hpp"

namespace fs = std::filesystem;

namespace {

void PrintUsage() {
  std::cerr << "Usage: calltrace-dump <run.db | run_dbs directory> [--out <file>] [--exceptions] [--config <config.yaml>]"
            << std::endl;
}

// Newest run_<stamp>.db of a directory; stamps sort lexicographically.
fs::path LatestRun(const fs::path& directory) {
  fs::path latest;
  for (const auto& entry : fs::directory_iterator(directory)) {
    const auto name = entry.path().filename().string();
    if (!entry.is_regular_file() || name.rfind("run_", 0) != 0 || entry.path().extension() != ".db") continue;
    if (latest.empty() || name > latest.filename().string()) latest = entry.path();
  }
  if (latest.empty()) {
    throw std::runtime_error("no run_*.db files in " + directory.string());
  }
  return latest;
}

} // namespace

int main(int argc, char** argv) {
  std::string input;
  std::string out_path;
  std::string config_path;
  bool        exceptions_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--out" && i + 1 < argc) {
      out_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--exceptions") {
      exceptions_only = true;
    } else if (!arg.empty() && arg[0] != '-' && input.empty()) {
      input = arg;
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (input.empty()) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = config_path.empty() ? calltrace::config::ConfigLoader::Defaults()
                                      : calltrace::config::ConfigLoader::LoadFromYaml(config_path);
    calltrace::observability::InitializeLogging(config);

    fs::path database = input;
    if (fs::is_directory(database)) {
      database = LatestRun(database);
    }

    auto                             repository = calltrace::factory::OpenRepository(database);
    calltrace::report::TraceDumper dumper(*repository);

    if (out_path.empty()) {
      if (exceptions_only) {
        std::cout << dumper.RenderExceptions();
      } else {
        std::cout << dumper.Render() << std::endl;
      }
    } else {
      if (exceptions_only) {
        dumper.RenderExceptionsToFile(out_path);
      } else {
        dumper.RenderToFile(out_path);
      }
      CALLTRACE_LOG_INFO("trace dump written", {calltrace::observability::StringField("database", database.string()),
                                                calltrace::observability::StringField("out", out_path)});
    }

    calltrace::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CALLTRACE_LOG_ERROR("Fatal error", {calltrace::observability::StringField("error", e.what())});
    calltrace::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
