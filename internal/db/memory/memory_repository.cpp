#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace calltrace::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Function
// ------------------------------------------------------------

Result MemoryRepository::GetOrCreateFunction(Transaction& t, model::FunctionRecord& r) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = FunctionKey{r.module, r.qualname, r.filename, r.lineno};

  if (auto it = s.function_by_key.find(key); it != s.function_by_key.end()) {
    r = s.functions.at(it->second);
    return Result::Ok();
  }

  r.id = s.next_function_id++;
  s.functions[r.id]     = r;
  s.function_by_key[key] = r.id;

  tx.OnRollback([id = r.id, key](State& st) {
    st.functions.erase(id);
    st.function_by_key.erase(key);
  });
  return Result::Ok();
}

std::optional<model::FunctionRecord> MemoryRepository::GetFunction(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.functions.find(id);
  if (it == s.functions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FunctionRecord> MemoryRepository::ListFunctions(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::FunctionRecord> out;
  out.reserve(s.functions.size());
  for (const auto& [_, record] : s.functions) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------
// Call
// ------------------------------------------------------------

Result MemoryRepository::InsertCall(Transaction& t, model::CallRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  if (!s.functions.contains(r.function_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown function_id " + std::to_string(r.function_id));
  }
  if (r.parent_call_id && !s.calls.contains(*r.parent_call_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown parent_call_id " + std::to_string(*r.parent_call_id));
  }

  r.id = s.next_call_id++;

  // only identity columns on insert; the outcome arrives via CompleteCall
  model::CallRecord stored;
  stored.id             = r.id;
  stored.function_id    = r.function_id;
  stored.parent_call_id = r.parent_call_id;
  stored.timestamp      = r.timestamp;
  stored.thread_id      = r.thread_id;
  stored.is_coroutine   = r.is_coroutine;
  stored.method_type    = r.method_type;
  stored.class_name     = r.class_name;
  s.calls[r.id]         = std::move(stored);

  tx.OnRollback([id = r.id](State& st) { st.calls.erase(id); });
  return Result::Ok();
}

Result MemoryRepository::CompleteCall(Transaction& t, int64_t call_id, const model::CallOutcome& o) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  auto it = s.calls.find(call_id);
  if (it == s.calls.end()) {
    return Result::Err(ErrorCode::NotFound, "call " + std::to_string(call_id) + " not found");
  }
  if (it->second.duration_ms) {
    return Result::Err(ErrorCode::Conflict, "call " + std::to_string(call_id) + " already completed");
  }

  auto before = it->second;

  auto& c             = it->second;
  c.duration_ms       = o.duration_ms;
  c.return_value      = o.return_value;
  c.exception_type    = o.exception_type;
  c.exception_message = o.exception_message;
  c.tb                = o.tb;

  tx.OnRollback([before = std::move(before)](State& st) { st.calls[before.id] = before; });
  return Result::Ok();
}

std::optional<model::CallRecord> MemoryRepository::GetCall(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.calls.find(id);
  if (it == s.calls.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CallRecord> MemoryRepository::ListCalls(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::CallRecord> out;
  out.reserve(s.calls.size());
  for (const auto& [_, record] : s.calls) {
    out.push_back(record);
  }
  return out;
}

std::vector<model::CallWithFunction> MemoryRepository::JoinCalls(const State& s, bool failed_only) const {
  std::vector<model::CallWithFunction> out;
  for (const auto& [_, call] : s.calls) {
    if (failed_only && !call.exception_type) continue;

    auto fn = s.functions.find(call.function_id);
    if (fn == s.functions.end()) continue;

    model::CallWithFunction row;
    row.call     = call;
    row.module   = fn->second.module;
    row.qualname = fn->second.qualname;
    out.push_back(std::move(row));
  }
  return out;
}

std::vector<model::CallWithFunction> MemoryRepository::ListCallsWithFunction(Transaction& t) {
  return JoinCalls(TX(t).View(), false);
}

std::vector<model::CallWithFunction> MemoryRepository::ListFailedCalls(Transaction& t) {
  return JoinCalls(TX(t).View(), true);
}

// ------------------------------------------------------------
// Argument
// ------------------------------------------------------------

Result MemoryRepository::InsertArguments(Transaction& t, std::vector<model::ArgumentRecord>& records) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  for (const auto& r : records) {
    if (!s.calls.contains(r.call_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "unknown call_id " + std::to_string(r.call_id));
    }
  }

  std::vector<int64_t> inserted;
  inserted.reserve(records.size());
  for (auto& r : records) {
    r.id              = s.next_argument_id++;
    s.arguments[r.id] = r;
    inserted.push_back(r.id);
  }

  tx.OnRollback([inserted = std::move(inserted)](State& st) {
    for (auto id : inserted) st.arguments.erase(id);
  });
  return Result::Ok();
}

std::vector<model::ArgumentRecord> MemoryRepository::GetArguments(Transaction& t, int64_t call_id) {
  std::vector<model::ArgumentRecord> out;
  for (const auto& [_, record] : TX(t).View().arguments) {
    if (record.call_id == call_id) out.push_back(record);
  }
  return out;
}

std::vector<model::ArgumentWithCall> MemoryRepository::ListArgumentsWithCall(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::ArgumentWithCall> out;
  for (const auto& [_, record] : s.arguments) {
    auto call = s.calls.find(record.call_id);
    if (call == s.calls.end()) continue;

    model::ArgumentWithCall row;
    row.argument    = record;
    row.function_id = call->second.function_id;
    row.timestamp   = call->second.timestamp;
    out.push_back(std::move(row));
  }
  return out;
}

} // namespace calltrace::db::memory
