#pragma once

#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace calltrace::db::memory {

class MemoryTransaction;

/*
  Process-local trace store.

  Same contract as the sqlite backend; used for tests and for runs
  that render the report before exit and need no file.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result GetOrCreateFunction(Transaction&, model::FunctionRecord&) override;
  std::optional<model::FunctionRecord> GetFunction(Transaction&, int64_t) override;
  std::vector<model::FunctionRecord> ListFunctions(Transaction&) override;

  Result InsertCall(Transaction&, model::CallRecord&) override;
  Result CompleteCall(Transaction&, int64_t, const model::CallOutcome&) override;
  std::optional<model::CallRecord> GetCall(Transaction&, int64_t) override;
  std::vector<model::CallRecord> ListCalls(Transaction&) override;
  std::vector<model::CallWithFunction> ListCallsWithFunction(Transaction&) override;
  std::vector<model::CallWithFunction> ListFailedCalls(Transaction&) override;

  Result InsertArguments(Transaction&, std::vector<model::ArgumentRecord>&) override;
  std::vector<model::ArgumentRecord> GetArguments(Transaction&, int64_t) override;
  std::vector<model::ArgumentWithCall> ListArgumentsWithCall(Transaction&) override;

private:
  friend class MemoryTransaction;

  using FunctionKey = std::tuple<std::string, std::string, std::string, int64_t>;

  // ordered maps keep listing order == id order
  struct State {
    std::map<int64_t, model::FunctionRecord> functions;
    std::map<FunctionKey, int64_t> function_by_key;
    std::map<int64_t, model::CallRecord> calls;
    std::map<int64_t, model::ArgumentRecord> arguments;

    int64_t next_function_id = 1;
    int64_t next_call_id = 1;
    int64_t next_argument_id = 1;
  };

  std::vector<model::CallWithFunction> JoinCalls(const State& s, bool failed_only) const;

  // held by a transaction for its whole lifetime
  std::mutex mutex_;
  State committed_;
};

}
