#include "internal/instrument/inclusion_policy.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "internal/util/errors.hpp"

namespace calltrace::instrument {

namespace fs = std::filesystem;

namespace {

fs::path Resolve(const fs::path& path) {
  std::error_code ec;
  auto absolute = fs::absolute(path, ec);
  if (ec) {
    throw util::InstrumentationError("cannot resolve '" + path.string() + "': " + ec.message());
  }
  auto resolved = fs::weakly_canonical(absolute, ec);
  if (ec) {
    throw util::InstrumentationError("cannot resolve '" + path.string() + "': " + ec.message());
  }
  return resolved.lexically_normal();
}

std::vector<std::string> OrDefault(const google::protobuf::RepeatedPtrField<std::string>& configured,
                                   std::vector<std::string> fallback) {
  if (configured.empty()) return fallback;
  return {configured.begin(), configured.end()};
}

} // namespace

InclusionRules InclusionRules::Defaults(fs::path project_root) {
  InclusionRules rules;
  rules.project_root             = std::move(project_root);
  rules.environment_marker_files = {"pyvenv.cfg", "CMakeCache.txt"};
  rules.environment_marker_dirs  = {"conda-meta"};
  rules.third_party_dirs = {"site-packages", "dist-packages", "third_party", "vendor",
                            "external",      "_deps",         "vcpkg_installed", "node_modules"};
  rules.runtime_prefixes = {"/usr/include", "/usr/lib", "/usr/local/include"};
  return rules;
}

InclusionRules InclusionRules::FromConfig(const calltrace::runtime::config::InstrumentationConfig& config) {
  auto rules = Defaults(config.project_root().empty() ? fs::path(".") : fs::path(config.project_root()));

  rules.environment_marker_files = OrDefault(config.environment_marker_files(), rules.environment_marker_files);
  rules.environment_marker_dirs  = OrDefault(config.environment_marker_dirs(), rules.environment_marker_dirs);
  rules.third_party_dirs         = OrDefault(config.third_party_dirs(), rules.third_party_dirs);
  rules.runtime_prefixes         = OrDefault(config.runtime_prefixes(), rules.runtime_prefixes);
  return rules;
}

const char* ToString(Verdict verdict) {
  switch (verdict) {
    case Verdict::kInclude:
      return "include";
    case Verdict::kOutsideProject:
      return "outside_project";
    case Verdict::kIsolatedEnvironment:
      return "isolated_environment";
    case Verdict::kThirdParty:
      return "third_party";
    case Verdict::kRuntimePrefix:
      return "runtime_prefix";
  }
  return "unknown";
}

bool IsWithin(const fs::path& path, const fs::path& base) {
  auto p = path.begin();
  for (auto b = base.begin(); b != base.end(); ++b, ++p) {
    // a trailing separator yields an empty last component
    if (b->empty()) continue;
    if (p == path.end() || *p != *b) return false;
  }
  return true;
}

InclusionPolicy::InclusionPolicy(InclusionRules rules) : rules_(std::move(rules)), root_(Resolve(rules_.project_root)) {
}

bool InclusionPolicy::IsEnvironmentRoot(const fs::path& dir, std::string* marker) const {
  std::error_code ec;
  for (const auto& file : rules_.environment_marker_files) {
    if (fs::is_regular_file(dir / file, ec)) {
      *marker = (dir / file).string();
      return true;
    }
  }
  for (const auto& sub : rules_.environment_marker_dirs) {
    if (fs::is_directory(dir / sub, ec)) {
      *marker = (dir / sub).string();
      return true;
    }
  }
  return false;
}

InclusionDecision InclusionPolicy::Evaluate(const fs::path& source_file) const {
  InclusionDecision decision;
  decision.resolved = Resolve(source_file);

  if (!IsWithin(decision.resolved, root_)) {
    decision.verdict = Verdict::kOutsideProject;
    decision.detail  = root_.string();
    return decision;
  }

  // ancestors strictly between the root and the file
  const auto relative = decision.resolved.lexically_relative(root_);
  auto       dir      = root_;
  auto       last     = std::prev(relative.end());
  for (auto it = relative.begin(); it != last; ++it) {
    dir /= *it;
    std::string marker;
    if (IsEnvironmentRoot(dir, &marker)) {
      decision.verdict = Verdict::kIsolatedEnvironment;
      decision.detail  = marker;
      return decision;
    }
  }

  for (auto it = relative.begin(); it != last; ++it) {
    const auto name = it->string();
    if (std::find(rules_.third_party_dirs.begin(), rules_.third_party_dirs.end(), name) != rules_.third_party_dirs.end()) {
      decision.verdict = Verdict::kThirdParty;
      decision.detail  = name;
      return decision;
    }
  }

  for (const auto& prefix : rules_.runtime_prefixes) {
    if (IsWithin(decision.resolved, fs::path(prefix).lexically_normal())) {
      decision.verdict = Verdict::kRuntimePrefix;
      decision.detail  = prefix;
      return decision;
    }
  }

  decision.verdict = Verdict::kInclude;
  return decision;
}

} // namespace calltrace::instrument
