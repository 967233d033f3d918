#include <assert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "calltrace/config/v1/config.pb.h"
#include "internal/instrument/inclusion_policy.hpp"

namespace {

namespace fs = std::filesystem;

using calltrace::instrument::InclusionPolicy;
using calltrace::instrument::InclusionRules;
using calltrace::instrument::IsWithin;
using calltrace::instrument::Verdict;

fs::path MakeRoot(const std::string& name) {
  const auto root = fs::temp_directory_path() / "calltrace_inclusion_policy_tests" / name;
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

void Touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << "\n";
}

void TestContainmentIsComponentWise() {
  assert(IsWithin("/a/b/c.cpp", "/a/b"));
  assert(IsWithin("/a/b", "/a/b"));
  assert(IsWithin("/a/b/c.cpp", "/a/b/"));
  assert(!IsWithin("/a/bc/d.cpp", "/a/b"));
  assert(!IsWithin("/a", "/a/b"));
}

void TestProjectFilesAreIncluded() {
  const auto root = MakeRoot("project");
  Touch(root / "src" / "core" / "engine.cpp");

  InclusionPolicy policy(InclusionRules::Defaults(root));
  const auto      decision = policy.Evaluate(root / "src" / "core" / "engine.cpp");
  assert(decision.Included());
  assert(decision.verdict == Verdict::kInclude);

  // resolution removes ".." before the containment check
  const auto escaped = policy.Evaluate(root / "src" / ".." / ".." / "other.cpp");
  assert(escaped.verdict == Verdict::kOutsideProject);
}

void TestEnvironmentMarkersExclude() {
  const auto root = MakeRoot("markers");
  Touch(root / "venv" / "pyvenv.cfg");
  Touch(root / "venv" / "lib" / "mod.cpp");
  fs::create_directories(root / "env" / "conda-meta");
  Touch(root / "env" / "pkg" / "mod.cpp");

  InclusionPolicy policy(InclusionRules::Defaults(root));

  const auto venv = policy.Evaluate(root / "venv" / "lib" / "mod.cpp");
  assert(venv.verdict == Verdict::kIsolatedEnvironment);
  assert(venv.detail.find("pyvenv.cfg") != std::string::npos);

  const auto conda = policy.Evaluate(root / "env" / "pkg" / "mod.cpp");
  assert(conda.verdict == Verdict::kIsolatedEnvironment);
  assert(conda.detail.find("conda-meta") != std::string::npos);
}

void TestMarkerAtRootDoesNotExclude() {
  // only ancestors strictly below the root count
  const auto root = MakeRoot("root_marker");
  Touch(root / "CMakeCache.txt");
  Touch(root / "main.cpp");

  InclusionPolicy policy(InclusionRules::Defaults(root));
  assert(policy.Evaluate(root / "main.cpp").Included());
}

void TestEnvironmentIsCheckedBeforeThirdParty() {
  const auto root = MakeRoot("ordering");
  Touch(root / "sandbox" / "CMakeCache.txt");
  Touch(root / "sandbox" / "_deps" / "lib.cpp");

  InclusionPolicy policy(InclusionRules::Defaults(root));
  assert(policy.Evaluate(root / "sandbox" / "_deps" / "lib.cpp").verdict == Verdict::kIsolatedEnvironment);
}

void TestThirdPartyDirectoriesExclude() {
  const auto root = MakeRoot("third_party");
  InclusionPolicy policy(InclusionRules::Defaults(root));

  for (const char* dir : {"site-packages", "dist-packages", "third_party", "vendor", "external", "_deps", "node_modules"}) {
    const auto decision = policy.Evaluate(root / "a" / dir / "pkg" / "x.cpp");
    assert(decision.verdict == Verdict::kThirdParty);
    assert(decision.detail == dir);
  }

  // a file merely named like a vendor directory is still project code
  assert(policy.Evaluate(root / "vendor.cpp").Included());
}

void TestRuntimePrefixesExclude() {
  auto rules             = InclusionRules::Defaults("/");
  rules.runtime_prefixes = {"/usr/include"};
  InclusionPolicy policy(rules);

  const auto decision = policy.Evaluate("/usr/include/calltrace_system_header.h");
  assert(decision.verdict == Verdict::kRuntimePrefix);
  assert(decision.detail == "/usr/include");
}

void TestConfigOverridesDefaults() {
  const auto root = MakeRoot("configured");

  calltrace::runtime::config::InstrumentationConfig config;
  config.set_project_root(root.string());
  config.add_third_party_dirs("deps");

  const auto rules = InclusionRules::FromConfig(config);
  assert(rules.third_party_dirs.size() == 1);
  assert(!rules.environment_marker_files.empty());

  InclusionPolicy policy(rules);
  assert(policy.Evaluate(root / "deps" / "x.cpp").verdict == Verdict::kThirdParty);
  assert(policy.Evaluate(root / "vendor" / "x.cpp").Included());
}

} // namespace

int main() {
  TestContainmentIsComponentWise();
  TestProjectFilesAreIncluded();
  TestEnvironmentMarkersExclude();
  TestMarkerAtRootDoesNotExclude();
  TestEnvironmentIsCheckedBeforeThirdParty();
  TestThirdPartyDirectoriesExclude();
  TestRuntimePrefixesExclude();
  TestConfigOverridesDefaults();

  std::cout << "calltrace_unit_inclusion_policy: pass\n";
  return 0;
}
