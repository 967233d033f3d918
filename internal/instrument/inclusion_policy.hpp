#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "calltrace/config/v1/config.pb.h"

namespace calltrace::instrument {

struct InclusionRules {
  std::filesystem::path project_root;

  std::vector<std::string> environment_marker_files;
  std::vector<std::string> environment_marker_dirs;
  std::vector<std::string> third_party_dirs;
  std::vector<std::string> runtime_prefixes;

  static InclusionRules Defaults(std::filesystem::path project_root);

  // Empty lists in the config keep the defaults.
  static InclusionRules FromConfig(const calltrace::runtime::config::InstrumentationConfig& config);
};

enum class Verdict {
  kInclude,
  kOutsideProject,
  kIsolatedEnvironment,
  kThirdParty,
  kRuntimePrefix,
};

const char* ToString(Verdict verdict);

struct InclusionDecision {
  Verdict               verdict = Verdict::kOutsideProject;
  std::filesystem::path resolved;
  // the matching marker, directory or prefix
  std::string detail;

  bool Included() const {
    return verdict == Verdict::kInclude;
  }
};

/*
  Decides whether a module's source file belongs to the traced program.

  Rules, first match wins:
    1. the file must lie inside the project root
    2. no ancestor between file and root may be an isolated environment
    3. no path component below the root may be a third-party directory
    4. the file must not lie under a runtime installation prefix

  Throws util::InstrumentationError if a path cannot be resolved.
*/
class InclusionPolicy {
 public:
  explicit InclusionPolicy(InclusionRules rules);

  InclusionDecision Evaluate(const std::filesystem::path& source_file) const;

  const InclusionRules& Rules() const {
    return rules_;
  }

 private:
  bool IsEnvironmentRoot(const std::filesystem::path& dir, std::string* marker) const;

  InclusionRules        rules_;
  std::filesystem::path root_;
};

// Component-wise containment; "/a/bc" is not inside "/a/b".
bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& base);

} // namespace calltrace::instrument
