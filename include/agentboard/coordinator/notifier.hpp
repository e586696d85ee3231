#pragma once

#include "agentboard/storage/journal.hpp"
#include "agentboard/task/task.hpp"
#include "agentboard/util/clock.hpp"
#include "agentboard/util/id.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace agentboard {

struct TransitionEvent {
  TaskId task_id;
  TaskStatus old_status{TaskStatus::Unclaimed};
  TaskStatus new_status{TaskStatus::Unclaimed};
  Timestamp timestamp{};
  AgentId actor;
  std::string note;
};

// Called synchronously after a status change is persisted. Implementations
// may throw std::exception; the coordinator logs it and the transition
// stands.
class TransitionNotifier {
public:
  virtual ~TransitionNotifier() = default;
  virtual auto on_transition(const TransitionEvent& event) -> void = 0;
};

class LoggingNotifier final : public TransitionNotifier {
public:
  auto on_transition(const TransitionEvent& event) -> void override;
};

// Appends every transition to the sqlite journal.
class JournalNotifier final : public TransitionNotifier {
public:
  explicit JournalNotifier(Journal& journal) : journal_(journal) {}

  auto on_transition(const TransitionEvent& event) -> void override;

private:
  Journal& journal_;
  std::mutex mu_;
};

class CallbackNotifier final : public TransitionNotifier {
public:
  using Callback = std::function<void(const TransitionEvent&)>;

  explicit CallbackNotifier(Callback callback)
      : callback_(std::move(callback)) {}

  auto on_transition(const TransitionEvent& event) -> void override {
    if (callback_) {
      callback_(event);
    }
  }

private:
  Callback callback_;
};

}  // namespace agentboard
