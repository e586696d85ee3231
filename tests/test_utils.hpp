#pragma once

#include "agentboard/coordinator/notifier.hpp"
#include "agentboard/storage/board_store.hpp"
#include "agentboard/util/clock.hpp"
#include "agentboard/util/id.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentboard::test {

[[nodiscard]] inline auto task_id(const char* s) -> TaskId {
  return TaskId{std::string{s}};
}

[[nodiscard]] inline auto task_id(std::string s) -> TaskId {
  return TaskId{std::move(s)};
}

[[nodiscard]] inline auto agent_id(const char* s) -> AgentId {
  return AgentId{std::string{s}};
}

[[nodiscard]] inline auto agent_id(std::string s) -> AgentId {
  return AgentId{std::move(s)};
}

// A fresh directory under /tmp, removed with everything in it.
class TempDir {
public:
  explicit TempDir(std::string_view prefix = "agentboard_test") {
    std::string pattern =
        (std::filesystem::temp_directory_path() / (std::string{prefix} + "_XXXXXX"))
            .string();
    if (::mkdtemp(pattern.data()) != nullptr) {
      path_ = pattern;
    }
  }
  ~TempDir() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto operator/(std::string_view name) const
      -> std::filesystem::path {
    return path_ / name;
  }

private:
  std::filesystem::path path_;
};

// Deterministic clock shared by every copy handed out.
class ManualClock {
public:
  explicit ManualClock(std::int64_t start_ms = 1'760'000'000'000)
      : now_(std::make_shared<std::atomic<std::int64_t>>(start_ms)) {}

  [[nodiscard]] auto clock() const -> Clock {
    auto now = now_;
    return [now] { return from_millis(now->load()); };
  }
  [[nodiscard]] auto now_ms() const -> std::int64_t {
    return now_->load();
  }
  auto advance(std::int64_t ms) -> void {
    now_->fetch_add(ms);
  }
  auto set(std::int64_t ms) -> void {
    now_->store(ms);
  }

private:
  std::shared_ptr<std::atomic<std::int64_t>> now_;
};

[[nodiscard]] inline auto fast_lock_options() -> LockOptions {
  LockOptions options;
  options.timeout = std::chrono::milliseconds{2000};
  options.stale_ttl = std::chrono::milliseconds{30000};
  options.initial_backoff = std::chrono::milliseconds{1};
  options.max_backoff = std::chrono::milliseconds{10};
  options.max_attempts = 100000;
  return options;
}

[[nodiscard]] inline auto store_options(const std::filesystem::path& root)
    -> BoardStoreOptions {
  BoardStoreOptions options;
  options.root = root;
  options.lock = fast_lock_options();
  return options;
}

[[nodiscard]] inline auto new_task(std::string_view id,
                                   std::string_view description = "do it",
                                   std::vector<std::string> deps = {},
                                   std::string_view priority = "NORMAL")
    -> nlohmann::json {
  return nlohmann::json{{"task_id", std::string{id}},
                        {"description", std::string{description}},
                        {"dependencies", std::move(deps)},
                        {"priority", std::string{priority}}};
}

// Collects every event it is handed.
class RecordingNotifier final : public TransitionNotifier {
public:
  auto on_transition(const TransitionEvent& event) -> void override {
    std::lock_guard lock(mu_);
    events_.push_back(event);
  }

  [[nodiscard]] auto events() const -> std::vector<TransitionEvent> {
    std::lock_guard lock(mu_);
    return events_;
  }

private:
  mutable std::mutex mu_;
  std::vector<TransitionEvent> events_;
};

}  // namespace agentboard::test
