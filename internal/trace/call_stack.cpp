#include "internal/trace/call_stack.hpp"

#include <functional>
#include <thread>

namespace calltrace::trace {

CallStack& CallStack::Current() {
  thread_local CallStack stack;
  return stack;
}

std::optional<int64_t> CallStack::Parent() const {
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->call_id) return it->call_id;
  }
  return std::nullopt;
}

void CallStack::Push(Frame frame) {
  frames_.push_back(frame);
}

void CallStack::Pop() {
  if (!frames_.empty()) frames_.pop_back();
}

ScopedFrame::ScopedFrame(CallStack& stack, CallStack::Frame frame) : stack_(stack) {
  stack_.Push(frame);
}

ScopedFrame::~ScopedFrame() {
  stack_.Pop();
}

uint64_t CurrentThreadId() {
  return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

} // namespace calltrace::trace
