#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace calltrace::trace {

struct FunctionInfo;

/*
  Per-thread stack of in-flight traced calls.

  A frame whose call row could not be stored keeps call_id empty; its
  children then attach to the nearest stored ancestor so the recorded
  parent is always a real enclosing call.
*/
class CallStack {
 public:
  struct Frame {
    std::optional<int64_t> call_id;
    const FunctionInfo*    info = nullptr;
  };

  // The calling thread's stack.
  static CallStack& Current();

  // Innermost frame with a stored call row.
  std::optional<int64_t> Parent() const;

  void Push(Frame frame);
  void Pop();

  const std::vector<Frame>& Frames() const {
    return frames_;
  }

  std::size_t Depth() const {
    return frames_.size();
  }

 private:
  std::vector<Frame> frames_;
};

/*
  Pushes on construction, pops on every exit path.
*/
class ScopedFrame {
 public:
  ScopedFrame(CallStack& stack, CallStack::Frame frame);
  ~ScopedFrame();

  ScopedFrame(const ScopedFrame&)            = delete;
  ScopedFrame& operator=(const ScopedFrame&) = delete;

 private:
  CallStack& stack_;
};

// Stable numeric id of the calling thread.
uint64_t CurrentThreadId();

} // namespace calltrace::trace
