#include <cstdint>
#include <iostream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "calltrace/v1.hpp"

// Small program whose functions are traced into a run database.
//
//   traced_demo [config.yaml]
//
// Dump the run afterwards with calltrace-dump run_dbs/

namespace demo {

class ValueError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ZeroDivisionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct Summary {
  int         total = 0;
  std::string status;
};

std::ostream& operator<<(std::ostream& out, const Summary& summary) {
  return out << "total=" << summary.total << " status=" << summary.status;
}

class Service {
 public:
  std::vector<double> Process(const std::vector<int>& data);
  double              Transform(int x);
};

int         Add(int a, int b);
int         Multiply(int x, int y);
int         NestedOperations(int n);
std::string MayFail(bool flag);
Summary     Orchestrator(int n, bool flag);
int64_t     Factorial(int64_t n);

calltrace::v1::Module kModule("demo", __FILE__);

const auto add               = CALLTRACE_DEFINE(kModule, Add, {.params = {"a", "b"}});
const auto multiply          = CALLTRACE_DEFINE(kModule, Multiply, {.params = {"x", "y"}, .defaults = {{"y", "2"}}});
const auto nested_operations = CALLTRACE_DEFINE(kModule, NestedOperations, {.params = {"n"}});
const auto may_fail          = CALLTRACE_DEFINE(kModule, MayFail, {.params = {"flag"}});
const auto orchestrator      = CALLTRACE_DEFINE(kModule, Orchestrator, {.params = {"n", "flag"}});
const auto factorial         = CALLTRACE_DEFINE(kModule, Factorial, {.params = {"n"}});
const auto process           = CALLTRACE_METHOD(kModule, Service, Process, {.params = {"data"}});
const auto transform         = CALLTRACE_METHOD(kModule, Service, Transform, {.params = {"x"}});

const int kStep = 7;

const auto increment = [](int x) { return x + kStep; };

const auto traced_increment =
    kModule.Define("increment", increment, {.params = {"x"}, .closure_vars = {{"kStep", std::to_string(kStep)}}});

int Add(int a, int b) {
  return a + b;
}

int Multiply(int x, int y) {
  return x * y;
}

int NestedOperations(int n) {
  int total = 0;
  for (int i = 0; i < n; ++i) {
    total = add(total, multiply(i, 2));
  }
  return total;
}

std::string MayFail(bool flag) {
  if (!flag) {
    throw ValueError("Flag must be True!");
  }
  return "Success";
}

Summary Orchestrator(int n, bool flag) {
  Summary summary;
  summary.total = nested_operations(n);
  try {
    summary.status = may_fail(flag);
  } catch (const ValueError&) {
    summary.status = "Recovered";
  }
  return summary;
}

std::vector<double> Service::Process(const std::vector<int>& data) {
  std::vector<double> out;
  for (int x : data) {
    out.push_back(transform(*this, x));
  }
  return out;
}

double Service::Transform(int x) {
  if (x == 0) {
    throw ZeroDivisionError("Cannot transform zero");
  }
  return 100.0 / x;
}

int64_t Factorial(int64_t n) {
  return n <= 1 ? 1 : n * factorial(n - 1);
}

} // namespace demo

int main(int argc, char** argv) {
  try {
    auto config = argc > 1 ? calltrace::v1::ConfigLoader::LoadFromYaml(argv[1]) : calltrace::v1::ConfigLoader::Defaults();

    calltrace::v1::TraceRuntime runtime(config);
    runtime.Start();

    std::cout << "Orchestrator result: " << demo::orchestrator(5, false) << std::endl;

    demo::Service service;
    try {
      auto values = demo::process(service, {5, 0, 2});
      std::cout << "Service result size: " << values.size() << std::endl;
    } catch (const demo::ZeroDivisionError&) {
      std::cout << "Caught error in Service::Process" << std::endl;
    }

    std::cout << "Factorial(4): " << demo::factorial(4) << std::endl;
    std::cout << "Increment via closure: " << demo::traced_increment(3) << std::endl;

    // each thread records its own root call
    std::vector<std::thread> workers;
    for (int i = 0; i < 2; ++i) {
      workers.emplace_back([i] { demo::orchestrator(i + 2, true); });
    }
    for (auto& worker : workers) {
      worker.join();
    }

    runtime.Stop();
    if (!runtime.DatabasePath().empty()) {
      std::cout << "Trace written to " << runtime.DatabasePath().string() << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "traced_demo: " << e.what() << std::endl;
    return 2;
  }
  return 0;
}
