#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace calltrace::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
