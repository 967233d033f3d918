#include <assert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/report/trace_dumper.hpp"

namespace {

using calltrace::db::Repository;
using calltrace::db::Result;
using calltrace::db::Transaction;
using calltrace::db::model::ArgumentRecord;
using calltrace::db::model::ArgumentWithCall;
using calltrace::db::model::CallOutcome;
using calltrace::db::model::CallRecord;
using calltrace::db::model::CallWithFunction;
using calltrace::db::model::FunctionRecord;
using calltrace::report::TraceDumper;

class NullTransaction : public Transaction {
 public:
  void Commit() override {
    done_ = true;
  }
  void Rollback() override {
    done_ = true;
  }
  bool IsCommitted() const override {
    return done_;
  }

 private:
  bool done_ = false;
};

// Serves fixed rows, including shapes a live store would reject.
class CannedRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return std::make_unique<NullTransaction>();
  }

  Result GetOrCreateFunction(Transaction&, FunctionRecord&) override {
    return Result::Err(calltrace::db::ErrorCode::Unsupported, "read-only");
  }
  std::optional<FunctionRecord> GetFunction(Transaction&, int64_t) override {
    return std::nullopt;
  }
  std::vector<FunctionRecord> ListFunctions(Transaction&) override {
    return functions;
  }
  Result InsertCall(Transaction&, CallRecord&) override {
    return Result::Err(calltrace::db::ErrorCode::Unsupported, "read-only");
  }
  Result CompleteCall(Transaction&, int64_t, const CallOutcome&) override {
    return Result::Err(calltrace::db::ErrorCode::Unsupported, "read-only");
  }
  std::optional<CallRecord> GetCall(Transaction&, int64_t) override {
    return std::nullopt;
  }
  std::vector<CallRecord> ListCalls(Transaction&) override {
    return calls;
  }
  std::vector<CallWithFunction> ListCallsWithFunction(Transaction&) override {
    std::vector<CallWithFunction> out;
    for (const auto& c : calls) out.push_back({c, "m", "f" + std::to_string(c.function_id)});
    return out;
  }
  std::vector<CallWithFunction> ListFailedCalls(Transaction& tx) override {
    std::vector<CallWithFunction> out;
    for (auto& row : ListCallsWithFunction(tx)) {
      if (row.call.exception_type) out.push_back(row);
    }
    return out;
  }
  Result InsertArguments(Transaction&, std::vector<ArgumentRecord>&) override {
    return Result::Err(calltrace::db::ErrorCode::Unsupported, "read-only");
  }
  std::vector<ArgumentRecord> GetArguments(Transaction&, int64_t) override {
    return {};
  }
  std::vector<ArgumentWithCall> ListArgumentsWithCall(Transaction&) override {
    std::vector<ArgumentWithCall> out;
    for (const auto& a : arguments) out.push_back({a, 1, 0.0});
    return out;
  }

  std::vector<FunctionRecord> functions;
  std::vector<CallRecord>     calls;
  std::vector<ArgumentRecord> arguments;
};

CallRecord Call(int64_t id, std::optional<int64_t> parent, double timestamp) {
  CallRecord c;
  c.id             = id;
  c.function_id    = 1;
  c.parent_call_id = parent;
  c.timestamp      = timestamp;
  c.thread_id      = 7;
  return c;
}

// Call ids in the order the report visits them.
std::vector<int64_t> VisitOrder(const std::string& text) {
  std::vector<int64_t> ids;
  std::istringstream   in(text);
  std::string          line;
  while (std::getline(in, line)) {
    const auto at = line.find("] CALL ");
    if (at == std::string::npos) continue;
    ids.push_back(std::stoll(line.substr(at + 7)));
  }
  return ids;
}

void TestRendersFullReport() {
  CannedRepository repo;

  FunctionRecord f;
  f.id          = 1;
  f.module      = "m";
  f.qualname    = "add";
  f.filename    = "/src/m.cpp";
  f.lineno      = 3;
  f.signature   = "(int a, int b) -> int";
  f.defaults    = "{\"b\":\"2\"}";
  f.source_code = "int add(int a, int b) {\n  return a + b;\n}";
  repo.functions.push_back(f);

  auto root         = Call(1, std::nullopt, 10.5);
  root.duration_ms  = 2.25;
  root.return_value = "3";
  repo.calls.push_back(root);

  auto child              = Call(2, 1, 10.75);
  child.duration_ms       = 0.5;
  child.method_type       = "instancemethod";
  child.class_name        = "Service";
  child.exception_type    = "ValueError";
  child.exception_message = "bad";
  child.tb                = "Traceback (most recent call last):\n  File \"/src/m.cpp\", line 3, in add\nValueError: bad\n";
  repo.calls.push_back(child);

  repo.arguments.push_back({1, 1, "a", "1"});
  repo.arguments.push_back({2, 1, "b", "2"});

  const std::string expected =
      "=== Functions Metadata ===\n"
      "Function ID: 1\n"
      "Module: m\n"
      "Qualified Name: add\n"
      "Defined at: /src/m.cpp:3\n"
      "Signature: (int a, int b) -> int\n"
      "Defaults: {\"b\":\"2\"}\n"
      "Source Code:\n"
      "    int add(int a, int b) {\n"
      "      return a + b;\n"
      "    }\n"
      "\n"
      "=== Call Execution Flow ===\n"
      "[DEPTH=0] CALL 1:\n"
      "[DEPTH=0]   Function ID: 1\n"
      "[DEPTH=0]   Timestamp: 10.5\n"
      "[DEPTH=0]   Duration (ms): 2.25\n"
      "[DEPTH=0]   Thread ID: 7  Coroutine: False\n"
      "[DEPTH=0]   Method Type: function  Class: None\n"
      "[DEPTH=0]   Arguments:\n"
      "[DEPTH=0]     - a: 1\n"
      "[DEPTH=0]     - b: 2\n"
      "[DEPTH=0]   Return Value: 3\n"
      "[DEPTH=1] CALL 2:\n"
      "[DEPTH=1]   Function ID: 1\n"
      "[DEPTH=1]   Timestamp: 10.75\n"
      "[DEPTH=1]   Duration (ms): 0.5\n"
      "[DEPTH=1]   Thread ID: 7  Coroutine: False\n"
      "[DEPTH=1]   Method Type: instancemethod  Class: Service\n"
      "[DEPTH=1]   Exception: ValueError - bad\n"
      "[DEPTH=1]   Traceback:\n"
      "[DEPTH=1]     Traceback (most recent call last):\n"
      "[DEPTH=1]       File \"/src/m.cpp\", line 3, in add\n"
      "[DEPTH=1]     ValueError: bad\n";

  TraceDumper dumper(repo);
  assert(dumper.Render() == expected);
  // read-only and deterministic
  assert(dumper.Render() == expected);
}

void TestInFlightCallPrintsNone() {
  CannedRepository repo;
  repo.calls.push_back(Call(1, std::nullopt, 1.0));

  const auto text = TraceDumper(repo).Render();
  assert(text.find("[DEPTH=0]   Duration (ms): None") != std::string::npos);
  assert(text.find("Return Value") == std::string::npos);
  assert(text.find("Exception") == std::string::npos);
}

void TestOrdersByTimestampThenId() {
  CannedRepository repo;
  repo.calls.push_back(Call(1, std::nullopt, 5.0));
  repo.calls.push_back(Call(2, std::nullopt, 1.0));
  repo.calls.push_back(Call(3, std::nullopt, 1.0));
  repo.calls.push_back(Call(4, 1, 9.0));
  repo.calls.push_back(Call(5, 1, 6.0));
  repo.calls.push_back(Call(6, 5, 7.0));

  const auto order = VisitOrder(TraceDumper(repo).Render());
  assert((order == std::vector<int64_t>{2, 3, 1, 5, 6, 4}));
}

void TestDepthFollowsNesting() {
  CannedRepository repo;
  repo.calls.push_back(Call(1, std::nullopt, 1.0));
  repo.calls.push_back(Call(2, 1, 2.0));
  repo.calls.push_back(Call(3, 2, 3.0));

  const auto text = TraceDumper(repo).Render();
  assert(text.find("[DEPTH=0] CALL 1:") != std::string::npos);
  assert(text.find("[DEPTH=1] CALL 2:") != std::string::npos);
  assert(text.find("[DEPTH=2] CALL 3:") != std::string::npos);
}

void TestOrphansAreRenderedAsRoots() {
  CannedRepository repo;
  repo.calls.push_back(Call(4, 99, 2.0));
  repo.calls.push_back(Call(5, std::nullopt, 1.0));

  const auto text = TraceDumper(repo).Render();
  assert(text.find("[DEPTH=0] CALL 4:") != std::string::npos);
  assert((VisitOrder(text) == std::vector<int64_t>{5, 4}));
}

void TestEmptyStore() {
  CannedRepository repo;
  assert(TraceDumper(repo).Render() == "=== Functions Metadata ===\n=== Call Execution Flow ===");
  assert(TraceDumper(repo).RenderExceptions() == "No exceptions recorded in this run.\n");
}

void TestRenderExceptions() {
  CannedRepository repo;
  auto             ok  = Call(1, std::nullopt, 1.0);
  auto             bad = Call(2, std::nullopt, 2.0);
  bad.exception_type    = "ZeroDivisionError";
  bad.exception_message = "Cannot transform zero";
  repo.calls            = {ok, bad};

  assert(TraceDumper(repo).RenderExceptions() == "CALL 2 f1: ZeroDivisionError - Cannot transform zero\n");
}

void TestRenderToFile() {
  CannedRepository repo;
  repo.calls.push_back(Call(1, std::nullopt, 1.0));

  const auto path = std::filesystem::temp_directory_path() / "calltrace_trace_dumper_tests" / "nested" / "dump_llm.txt";
  std::filesystem::remove_all(path.parent_path().parent_path());

  TraceDumper dumper(repo);
  dumper.RenderToFile(path);

  std::ifstream      in(path);
  std::ostringstream contents;
  contents << in.rdbuf();
  assert(contents.str() == dumper.Render());
}

void TestRenderExceptionsToFile() {
  CannedRepository repo;
  auto             bad = Call(3, std::nullopt, 1.0);
  bad.exception_type    = "ValueError";
  bad.exception_message = "bad";
  repo.calls            = {bad};

  const auto path = std::filesystem::temp_directory_path() / "calltrace_trace_dumper_tests" / "exceptions" / "failed.txt";
  std::filesystem::remove_all(path.parent_path());

  TraceDumper dumper(repo);
  dumper.RenderExceptionsToFile(path);

  std::ifstream      in(path);
  std::ostringstream contents;
  contents << in.rdbuf();
  assert(contents.str() == "CALL 3 f1: ValueError - bad\n");
}

} // namespace

int main() {
  TestRendersFullReport();
  TestInFlightCallPrintsNone();
  TestOrdersByTimestampThenId();
  TestDepthFollowsNesting();
  TestOrphansAreRenderedAsRoots();
  TestEmptyStore();
  TestRenderExceptions();
  TestRenderToFile();
  TestRenderExceptionsToFile();

  std::cout << "calltrace_unit_trace_dumper: pass\n";
  return 0;
}
