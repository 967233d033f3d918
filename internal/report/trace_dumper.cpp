#include "internal/report/trace_dumper.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace calltrace::report {

namespace {

using db::model::ArgumentRecord;
using db::model::CallRecord;

template <typename T>
std::string OrNone(const std::optional<T>& value) {
  if (!value) return "None";
  return fmt::format("{}", *value);
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t              begin = 0;
  while (begin < text.size()) {
    auto end = text.find('\n', begin);
    if (end == std::string::npos) end = text.size();
    lines.push_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
  return lines;
}

struct CallTree {
  std::map<int64_t, CallRecord>           calls;
  std::map<int64_t, std::vector<int64_t>> children;
  std::vector<int64_t>                    roots;

  bool Earlier(int64_t a, int64_t b) const {
    const auto& ca = calls.at(a);
    const auto& cb = calls.at(b);
    if (ca.timestamp != cb.timestamp) return ca.timestamp < cb.timestamp;
    return a < b;
  }
};

CallTree BuildTree(std::vector<CallRecord> rows) {
  CallTree tree;
  for (auto& row : rows) {
    const auto id = row.id;
    tree.calls.emplace(id, std::move(row));
  }

  for (const auto& [id, call] : tree.calls) {
    if (call.parent_call_id && *call.parent_call_id != id && tree.calls.count(*call.parent_call_id)) {
      tree.children[*call.parent_call_id].push_back(id);
    } else {
      tree.roots.push_back(id);
    }
  }

  auto earlier = [&tree](int64_t a, int64_t b) { return tree.Earlier(a, b); };
  std::sort(tree.roots.begin(), tree.roots.end(), earlier);
  for (auto& [parent, ids] : tree.children) {
    std::sort(ids.begin(), ids.end(), earlier);
  }
  return tree;
}

} // namespace

TraceDumper::TraceDumper(db::Repository& repository) : repository_(repository) {
}

std::string TraceDumper::Render() {
  auto tx        = repository_.Begin();
  auto functions = repository_.ListFunctions(*tx);
  auto tree      = BuildTree(repository_.ListCalls(*tx));

  std::map<int64_t, std::vector<ArgumentRecord>> arguments;
  for (auto& row : repository_.ListArgumentsWithCall(*tx)) {
    arguments[row.argument.call_id].push_back(std::move(row.argument));
  }
  tx->Commit();

  std::vector<std::string> lines;

  lines.emplace_back("=== Functions Metadata ===");
  for (const auto& f : functions) {
    lines.push_back(fmt::format("Function ID: {}", f.id));
    lines.push_back(fmt::format("Module: {}", f.module));
    lines.push_back(fmt::format("Qualified Name: {}", f.qualname));
    lines.push_back(fmt::format("Defined at: {}:{}", f.filename, f.lineno));
    lines.push_back(fmt::format("Signature: {}", f.signature));
    if (f.annotations && !f.annotations->empty()) lines.push_back("Annotations: " + *f.annotations);
    if (f.defaults && !f.defaults->empty()) lines.push_back("Defaults: " + *f.defaults);
    if (f.kwdefaults && !f.kwdefaults->empty()) lines.push_back("Kwdefaults: " + *f.kwdefaults);
    if (f.closure_vars && !f.closure_vars->empty()) lines.push_back("Closure Vars: " + *f.closure_vars);
    lines.emplace_back("Source Code:");
    for (const auto& src : SplitLines(f.source_code.value_or(""))) {
      lines.push_back("    " + src);
    }
    lines.emplace_back("");
  }

  lines.emplace_back("=== Call Execution Flow ===");

  std::set<int64_t> visited;

  std::function<void(int64_t, int)> render = [&](int64_t id, int depth) {
    if (!visited.insert(id).second) return;

    const auto  prefix = fmt::format("[DEPTH={}] ", depth);
    const auto& c      = tree.calls.at(id);

    lines.push_back(fmt::format("{}CALL {}:", prefix, id));
    lines.push_back(fmt::format("{}  Function ID: {}", prefix, c.function_id));
    lines.push_back(fmt::format("{}  Timestamp: {}", prefix, c.timestamp));
    lines.push_back(fmt::format("{}  Duration (ms): {}", prefix, OrNone(c.duration_ms)));
    lines.push_back(fmt::format("{}  Thread ID: {}  Coroutine: {}", prefix, c.thread_id, c.is_coroutine ? "True" : "False"));
    lines.push_back(fmt::format("{}  Method Type: {}  Class: {}", prefix, c.method_type, OrNone(c.class_name)));

    if (auto it = arguments.find(id); it != arguments.end() && !it->second.empty()) {
      lines.push_back(prefix + "  Arguments:");
      for (const auto& argument : it->second) {
        lines.push_back(fmt::format("{}    - {}: {}", prefix, argument.name, argument.value));
      }
    }
    if (c.return_value) {
      lines.push_back(fmt::format("{}  Return Value: {}", prefix, *c.return_value));
    }
    if (c.exception_type && !c.exception_type->empty()) {
      lines.push_back(fmt::format("{}  Exception: {} - {}", prefix, *c.exception_type, OrNone(c.exception_message)));
    }
    if (c.tb && !c.tb->empty()) {
      lines.push_back(prefix + "  Traceback:");
      for (const auto& tb_line : SplitLines(*c.tb)) {
        lines.push_back(prefix + "    " + tb_line);
      }
    }

    if (auto it = tree.children.find(id); it != tree.children.end()) {
      for (const auto child : it->second) {
        render(child, depth + 1);
      }
    }
  };

  for (const auto root : tree.roots) {
    render(root, 0);
    lines.emplace_back("");
  }

  std::string text;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i) text += '\n';
    text += lines[i];
  }
  return text;
}

std::string TraceDumper::RenderExceptions() {
  auto tx     = repository_.Begin();
  auto failed = repository_.ListFailedCalls(*tx);
  tx->Commit();

  if (failed.empty()) {
    return "No exceptions recorded in this run.\n";
  }

  std::string text;
  for (const auto& row : failed) {
    text += fmt::format("CALL {} {}: {} - {}\n", row.call.id, row.qualname, row.call.exception_type.value_or(""),
                        row.call.exception_message.value_or(""));
  }
  return text;
}

void TraceDumper::RenderToFile(const std::filesystem::path& path) {
  WriteFile(path, Render());
}

void TraceDumper::RenderExceptionsToFile(const std::filesystem::path& path) {
  WriteFile(path, RenderExceptions());
}

void TraceDumper::WriteFile(const std::filesystem::path& path, const std::string& text) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path.string() + " for writing");
  }
  out << text;
  if (!out) {
    throw std::runtime_error("failed writing " + path.string());
  }
}

} // namespace calltrace::report
