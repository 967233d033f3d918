#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/argument_record.hpp"
#include "internal/db/model/call_record.hpp"
#include "internal/db/model/function_record.hpp"

namespace calltrace::db {

/*
  Trace store abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - GetOrCreateFunction is idempotent per identity key
  - CompleteCall succeeds at most once per call row

  The store holds no business logic. It is the durable interchange
  format between a traced run and any offline consumer.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Functions
  // ---------------------------------------------------------------------

  // Looks up (module, qualname, filename, lineno); inserts when absent.
  // On success record.id holds the stored id. An existing row is never
  // overwritten.
  virtual Result GetOrCreateFunction(Transaction&, model::FunctionRecord& record) = 0;

  virtual std::optional<model::FunctionRecord> GetFunction(Transaction&, int64_t id) = 0;

  virtual std::vector<model::FunctionRecord> ListFunctions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Calls
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertCall(Transaction&, model::CallRecord& record) = 0;

  // NotFound for an unknown id, Conflict when the call already completed.
  virtual Result CompleteCall(Transaction&, int64_t call_id, const model::CallOutcome& outcome) = 0;

  virtual std::optional<model::CallRecord> GetCall(Transaction&, int64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::CallRecord> ListCalls(Transaction&) = 0;

  virtual std::vector<model::CallWithFunction> ListCallsWithFunction(Transaction&) = 0;

  // Calls with a non-null exception type.
  virtual std::vector<model::CallWithFunction> ListFailedCalls(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Arguments
  // ---------------------------------------------------------------------

  // Assigns ids. Either all rows are stored or none.
  virtual Result InsertArguments(Transaction&, std::vector<model::ArgumentRecord>& records) = 0;

  // Ordered by id, i.e. parameter order.
  virtual std::vector<model::ArgumentRecord> GetArguments(Transaction&, int64_t call_id) = 0;

  virtual std::vector<model::ArgumentWithCall> ListArgumentsWithCall(Transaction&) = 0;
};

} // namespace calltrace::db
