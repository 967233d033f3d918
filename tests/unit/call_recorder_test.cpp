#include <assert.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/instrument/inclusion_policy.hpp"
#include "internal/instrument/module.hpp"
#include "internal/instrument/module_loader.hpp"
#include "internal/trace/call_recorder.hpp"
#include "internal/util/errors.hpp"

namespace {

using calltrace::db::Repository;
using calltrace::db::Result;
using calltrace::db::Transaction;
using calltrace::db::memory::MemoryRepository;
using calltrace::db::model::CallRecord;
using calltrace::instrument::InclusionPolicy;
using calltrace::instrument::InclusionRules;
using calltrace::instrument::Module;
using calltrace::instrument::ModuleLoader;
using calltrace::instrument::ModuleRegistry;
using calltrace::instrument::Traced;
using calltrace::trace::CallKind;
using calltrace::trace::CallRecorder;

class ValueError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Forwards to another store; function and call inserts can be made to fail.
class HookedRepository : public Repository {
 public:
  explicit HookedRepository(std::shared_ptr<Repository> inner = std::make_shared<MemoryRepository>())
      : inner_(std::move(inner)) {}

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }

  Result GetOrCreateFunction(Transaction& tx, calltrace::db::model::FunctionRecord& record) override {
    if (fail_function_inserts.load()) {
      return Result::Err(calltrace::db::ErrorCode::IOError, "injected failure");
    }
    return inner_->GetOrCreateFunction(tx, record);
  }

  std::optional<calltrace::db::model::FunctionRecord> GetFunction(Transaction& tx, int64_t id) override {
    return inner_->GetFunction(tx, id);
  }

  std::vector<calltrace::db::model::FunctionRecord> ListFunctions(Transaction& tx) override {
    return inner_->ListFunctions(tx);
  }

  Result InsertCall(Transaction& tx, CallRecord& record) override {
    if (fail_call_inserts.load()) {
      return Result::Err(calltrace::db::ErrorCode::IOError, "injected failure");
    }
    return inner_->InsertCall(tx, record);
  }

  Result CompleteCall(Transaction& tx, int64_t call_id, const calltrace::db::model::CallOutcome& outcome) override {
    return inner_->CompleteCall(tx, call_id, outcome);
  }

  std::optional<CallRecord> GetCall(Transaction& tx, int64_t id) override {
    return inner_->GetCall(tx, id);
  }

  std::vector<CallRecord> ListCalls(Transaction& tx) override {
    return inner_->ListCalls(tx);
  }

  std::vector<calltrace::db::model::CallWithFunction> ListCallsWithFunction(Transaction& tx) override {
    return inner_->ListCallsWithFunction(tx);
  }

  std::vector<calltrace::db::model::CallWithFunction> ListFailedCalls(Transaction& tx) override {
    return inner_->ListFailedCalls(tx);
  }

  Result InsertArguments(Transaction& tx, std::vector<calltrace::db::model::ArgumentRecord>& records) override {
    return inner_->InsertArguments(tx, records);
  }

  std::vector<calltrace::db::model::ArgumentRecord> GetArguments(Transaction& tx, int64_t call_id) override {
    return inner_->GetArguments(tx, call_id);
  }

  std::vector<calltrace::db::model::ArgumentWithCall> ListArgumentsWithCall(Transaction& tx) override {
    return inner_->ListArgumentsWithCall(tx);
  }

  std::atomic<bool> fail_function_inserts{false};
  std::atomic<bool> fail_call_inserts{false};

 private:
  std::shared_ptr<Repository> inner_;
};

// One instrumented module over a fresh store.
struct Harness {
  explicit Harness(std::shared_ptr<Repository> repo = std::make_shared<MemoryRepository>())
      : repository(std::move(repo)),
        recorder(std::make_shared<CallRecorder>(repository)),
        loader(InclusionPolicy(InclusionRules::Defaults(std::filesystem::path(__FILE__).parent_path())), recorder, false) {}

  void Load() {
    const auto report = loader.Load(module);
    assert(report.state == Module::State::kInstrumented);
  }

  std::vector<CallRecord> Calls() {
    auto tx    = repository->Begin();
    auto calls = repository->ListCalls(*tx);
    tx->Commit();
    return calls;
  }

  std::map<std::string, std::string> Arguments(int64_t call_id) {
    auto                               tx = repository->Begin();
    std::map<std::string, std::string> out;
    for (const auto& a : repository->GetArguments(*tx, call_id)) out[a.name] = a.value;
    tx->Commit();
    return out;
  }

  std::shared_ptr<Repository>   repository;
  std::shared_ptr<CallRecorder> recorder;
  ModuleRegistry                registry;
  Module                        module{"recorder_test", __FILE__, registry};
  ModuleLoader                  loader;
};

void TestAddMultiplyScenario() {
  Harness h;
  auto    add      = h.module.Define("add", [](int a, int b) { return a + b; }, {.params = {"a", "b"}, .line = __LINE__});
  auto    multiply = h.module.Define("multiply", [](int x, int y) { return x * y; }, {.params = {"x", "y"}, .line = __LINE__});
  h.Load();

  const int six   = multiply(3, 2);
  const int eight = multiply(4, 2);
  assert(add(six, eight) == 14);

  const auto calls = h.Calls();
  assert(calls.size() == 3);
  for (const auto& c : calls) {
    assert(!c.parent_call_id.has_value());
    assert(c.duration_ms.has_value() && *c.duration_ms >= 0.0);
    assert(c.method_type == "function");
    assert(!c.exception_type.has_value());
  }

  assert(calls[2].return_value == std::optional<std::string>("14"));

  auto first = h.Arguments(calls[0].id);
  assert(first["x"] == "3" && first["y"] == "2");
  auto second = h.Arguments(calls[1].id);
  assert(second["x"] == "4" && second["y"] == "2");
  auto sum = h.Arguments(calls[2].id);
  assert(sum["a"] == "6" && sum["b"] == "8");
}

void TestValueErrorScenario() {
  Harness h;
  auto    fail = h.module.Define(
      "fail", [](int) -> int { throw ValueError("bad"); }, {.params = {"flag"}, .line = __LINE__});
  h.Load();

  bool caught = false;
  try {
    fail(0);
  } catch (const ValueError& e) {
    caught = std::string(e.what()) == "bad";
  }
  assert(caught);

  const auto calls = h.Calls();
  assert(calls.size() == 1);
  assert(calls[0].exception_type == std::optional<std::string>("ValueError"));
  assert(calls[0].exception_message == std::optional<std::string>("bad"));
  assert(calls[0].tb.has_value() && !calls[0].tb->empty());
  assert(calls[0].tb->rfind("Traceback (most recent call last):", 0) == 0);
  assert(calls[0].tb->find("in fail") != std::string::npos);
  assert(calls[0].tb->find("ValueError: bad") != std::string::npos);
  assert(!calls[0].return_value.has_value());
  assert(calls[0].duration_ms.has_value());
}

void TestNonStandardExceptionIsRethrownUnchanged() {
  Harness h;
  auto    raise_int = h.module.Define("raise_int", []() -> int { throw 7; }, {.line = __LINE__});
  h.Load();

  int thrown = 0;
  try {
    raise_int();
  } catch (int value) {
    thrown = value;
  }
  assert(thrown == 7);

  const auto calls = h.Calls();
  assert(calls[0].exception_type == std::optional<std::string>("int"));
  assert(calls[0].exception_message == std::optional<std::string>(""));
}

void TestNestedCallsRecordParent() {
  Harness h;
  auto    inner = h.module.Define("inner", [](int x) { return x + 1; }, {.params = {"x"}, .line = __LINE__});
  auto    outer = h.module.Define(
      "outer", [inner](int x) { return inner(x) * 2; }, {.params = {"x"}, .line = __LINE__});
  h.Load();

  assert(outer(1) == 4);

  const auto calls = h.Calls();
  assert(calls.size() == 2);
  const auto& parent = calls[0];
  const auto& child  = calls[1];
  assert(!parent.parent_call_id.has_value());
  assert(child.parent_call_id == parent.id);
  assert(parent.timestamp <= child.timestamp);
  assert(child.thread_id == parent.thread_id);
}

void TestRecursionBuildsChain() {
  Harness                   h;
  Traced<int64_t(int64_t)> factorial;
  factorial = h.module.Define(
      "factorial", [&factorial](int64_t n) -> int64_t { return n <= 1 ? 1 : n * factorial(n - 1); },
      {.params = {"n"}, .line = __LINE__});
  h.Load();

  assert(factorial(4) == 24);

  const auto calls = h.Calls();
  assert(calls.size() == 4);
  for (std::size_t i = 1; i < calls.size(); ++i) {
    assert(calls[i].parent_call_id == calls[i - 1].id);
  }
  assert(calls[0].return_value == std::optional<std::string>("24"));
  assert(calls[3].return_value == std::optional<std::string>("1"));
}

void RunThreadsHaveIndependentRoots(Harness& h) {
  auto    leaf = h.module.Define("leaf", [](int x) { return x; }, {.params = {"x"}, .line = __LINE__});
  auto    root = h.module.Define(
      "root", [leaf](int x) { return leaf(x) + leaf(x); }, {.params = {"x"}, .line = __LINE__});
  h.Load();

  constexpr int            kThreads = 4;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&root, i] {
      for (int j = 0; j < 10; ++j) {
        assert(root(i) == 2 * i);
      }
    });
  }
  for (auto& t : threads) t.join();

  const auto calls = h.Calls();
  assert(calls.size() == kThreads * 10 * 3);

  std::map<int64_t, CallRecord> by_id;
  for (const auto& c : calls) by_id[c.id] = c;

  std::size_t roots = 0;
  for (const auto& c : calls) {
    if (!c.parent_call_id) {
      ++roots;
      continue;
    }
    const auto& parent = by_id.at(*c.parent_call_id);
    assert(parent.thread_id == c.thread_id);
    assert(!parent.parent_call_id.has_value());
  }
  assert(roots == kThreads * 10);
}

void TestThreadsHaveIndependentRoots() {
  Harness h;
  RunThreadsHaveIndependentRoots(h);
}

#if CALLTRACE_DB_SQLITE
std::shared_ptr<Repository> FreshSqliteStore(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "calltrace_call_recorder_tests" / name;
  std::filesystem::remove_all(dir);

  auto config = calltrace::config::ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_directory(dir.string());
  return calltrace::factory::BuildRuntime(config).repository;
}

void TestThreadsHaveIndependentRootsOnSqlite() {
  Harness h(FreshSqliteStore("threads"));
  RunThreadsHaveIndependentRoots(h);
}
#endif

// Same identity key from every harness that calls it.
Traced<int(int)> DefineTriple(Module& module) {
  return module.Define("triple", [](int x) { return 3 * x; }, {.params = {"x"}, .line = __LINE__});
}

// Function rows are unreachable at load, so every definition registers on
// its first call; two recorders with separate caches race on one store.
void RunConcurrentFirstRegistration(const std::shared_ptr<Repository>& store) {
  auto    repo = std::make_shared<HookedRepository>(store);
  Harness a(repo);
  Harness b(repo);
  auto    triple_a = DefineTriple(a.module);
  auto    triple_b = DefineTriple(b.module);

  repo->fail_function_inserts = true;
  a.Load();
  b.Load();
  repo->fail_function_inserts = false;

  {
    auto tx = repo->Begin();
    assert(repo->ListFunctions(*tx).empty());
    tx->Commit();
  }

  constexpr int            kThreads = 8;
  constexpr int            kCalls   = 5;
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    const auto& triple = i % 2 == 0 ? triple_a : triple_b;
    threads.emplace_back([&triple, &go, i] {
      while (!go.load()) std::this_thread::yield();
      for (int j = 0; j < kCalls; ++j) {
        assert(triple(i) == 3 * i);
      }
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  auto tx        = repo->Begin();
  auto functions = repo->ListFunctions(*tx);
  auto calls     = repo->ListCalls(*tx);
  tx->Commit();

  assert(functions.size() == 1);
  assert(functions[0].qualname == "triple");
  assert(calls.size() == kThreads * kCalls);
  for (const auto& c : calls) {
    assert(c.function_id == functions[0].id);
  }
  assert(a.recorder->StoreFailures() + b.recorder->StoreFailures() == 2);
}

void TestConcurrentFirstRegistration() {
  RunConcurrentFirstRegistration(std::make_shared<MemoryRepository>());
#if CALLTRACE_DB_SQLITE
  RunConcurrentFirstRegistration(FreshSqliteStore("first_registration"));
#endif
}

void TestFunctionRowIsCreatedOnce() {
  Harness h;
  auto    twice = h.module.Define("twice", [](int x) { return 2 * x; }, {.params = {"x"}, .line = __LINE__});
  h.Load();

  for (int i = 0; i < 5; ++i) twice(i);

  const auto id_a = h.recorder->RegisterFunction(twice.Info());
  const auto id_b = h.recorder->RegisterFunction(twice.Info());
  assert(id_a && id_b && *id_a == *id_b);

  auto tx        = h.repository->Begin();
  auto functions = h.repository->ListFunctions(*tx);
  tx->Commit();
  assert(functions.size() == 1);
  assert(functions[0].qualname == "twice");
  assert(functions[0].signature == "(int x) -> int");

  for (const auto& c : h.Calls()) {
    assert(c.function_id == functions[0].id);
  }
}

void TestValuesAreTruncated() {
  Harness h;
  auto    echo = h.module.Define(
      "echo", [](const std::string& text) { return text; }, {.params = {"text"}, .line = __LINE__});
  h.Load();

  const std::string big(5000, 'x');
  assert(echo(big) == big);

  const auto calls = h.Calls();
  assert(calls[0].return_value->size() == 1000);
  assert(h.Arguments(calls[0].id)["text"].size() == 1000);
}

void TestVoidAndUnnamedParameters() {
  Harness h;
  int     sink = 0;
  auto    store = h.module.Define("store", [&sink](int a, int b) { sink = a + b; }, {.params = {"a"}, .line = __LINE__});
  h.Load();

  store(2, 3);
  assert(sink == 5);

  const auto calls = h.Calls();
  assert(calls[0].return_value == std::optional<std::string>("null"));
  auto args = h.Arguments(calls[0].id);
  assert(args["a"] == "2");
  assert(args["arg1"] == "3");
}

class Shape {
 public:
  virtual ~Shape() = default;
  virtual int Sides() const {
    return 0;
  }
  int Describe(int scale) const {
    return Sides() * scale;
  }
  static int Count(int n) {
    return n;
  }
};

class Square : public Shape {
 public:
  int Sides() const override {
    return 4;
  }
};

void TestMethodKinds() {
  Harness h;
  auto    describe = h.module.Define("Shape::Describe", &Shape::Describe, {.params = {"scale"}, .line = __LINE__});
  auto    count    = h.module.Define("Shape::Count", &Shape::Count,
                                     {.params = {"n"}, .kind = CallKind::kStaticMethod, .class_name = "Shape", .line = __LINE__});
  h.Load();

  Square square;
  assert(describe(square, 3) == 12);
  assert(count(5) == 5);
  assert(describe.Signature() == "(const Shape& self, int scale) -> int");

  const auto calls = h.Calls();
  assert(calls[0].method_type == "instancemethod");
  assert(calls[0].class_name == std::optional<std::string>("Square"));
  assert(h.Arguments(calls[0].id)["scale"] == "3");
  assert(calls[1].method_type == "staticmethod");
  assert(calls[1].class_name == std::optional<std::string>("Shape"));
}

void TestStoreFailureDoesNotChangeResults() {
  auto repo = std::make_shared<HookedRepository>();
  Harness h(repo);
  auto    inner = h.module.Define("inner", [](int x) { return x + 1; }, {.params = {"x"}, .line = __LINE__});
  auto    middle = h.module.Define("middle", [inner](int x) { return inner(x); }, {.params = {"x"}, .line = __LINE__});
  auto    outer  = h.module.Define(
      "outer",
      [middle, &repo](int x) {
        repo->fail_call_inserts = true;
        const int r             = middle(x);
        repo->fail_call_inserts = false;
        return r;
      },
      {.params = {"x"}, .line = __LINE__});
  auto thrower = h.module.Define("thrower", []() -> int { throw ValueError("kept"); }, {.line = __LINE__});
  h.Load();

  assert(outer(1) == 2);
  assert(h.recorder->StoreFailures() >= 2);

  // middle and inner were lost; nothing dangles from a missing row
  const auto calls = h.Calls();
  assert(calls.size() == 1);
  assert(calls[0].return_value == std::optional<std::string>("2"));

  repo->fail_call_inserts = true;
  bool caught             = false;
  try {
    thrower();
  } catch (const ValueError& e) {
    caught = std::string(e.what()) == "kept";
  }
  assert(caught);
  repo->fail_call_inserts = false;
}

} // namespace

namespace loud_types {

struct Loud {
  int value = 0;
};

std::ostream& operator<<(std::ostream&, const Loud&) {
  throw std::logic_error("formatter failure");
}

} // namespace loud_types

namespace {

using loud_types::Loud;

void TestThrowingFormatterDoesNotReachCaller() {
  Harness h;
  int     body_runs = 0;
  auto    make_loud = h.module.Define(
      "MakeLoud", [&body_runs](int v) { ++body_runs; return Loud{v}; }, {.params = {"v"}, .line = __LINE__});
  auto takes_loud = h.module.Define(
      "TakesLoud", [](Loud l) { return l.value + 1; }, {.params = {"l"}, .line = __LINE__});
  h.Load();

  const Loud made = make_loud(41);
  assert(made.value == 41);
  assert(body_runs == 1);
  assert(takes_loud(Loud{1}) == 2);
  assert(h.recorder->SerializationFailures() == 2);

  const auto calls = h.Calls();
  assert(calls.size() == 2);
  assert(calls[0].return_value == std::optional<std::string>("\"<loud_types::Loud object>\""));
  assert(!calls[0].exception_type.has_value());
  assert(h.Arguments(calls[1].id)["l"] == "\"<loud_types::Loud object>\"");
  assert(calls[1].return_value == std::optional<std::string>("2"));
}

void TestCallsBeforeLoadAreRejected() {
  Harness h;
  auto    early = h.module.Define("early", [](int x) { return x; }, {.line = __LINE__});

  bool threw = false;
  try {
    early(1);
  } catch (const calltrace::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!early.IsInstrumented());

  h.Load();
  assert(early(1) == 1);
  assert(early.IsInstrumented());
}

} // namespace

int main() {
  TestAddMultiplyScenario();
  TestValueErrorScenario();
  TestNonStandardExceptionIsRethrownUnchanged();
  TestNestedCallsRecordParent();
  TestRecursionBuildsChain();
  TestThreadsHaveIndependentRoots();
#if CALLTRACE_DB_SQLITE
  TestThreadsHaveIndependentRootsOnSqlite();
#endif
  TestConcurrentFirstRegistration();
  TestFunctionRowIsCreatedOnce();
  TestValuesAreTruncated();
  TestVoidAndUnnamedParameters();
  TestMethodKinds();
  TestStoreFailureDoesNotChangeResults();
  TestThrowingFormatterDoesNotReachCaller();
  TestCallsBeforeLoadAreRejected();

  std::cout << "calltrace_unit_call_recorder: pass\n";
  return 0;
}
