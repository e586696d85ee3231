#pragma once

#include "agentboard/core/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace agentboard {

struct LockOptions {
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds stale_ttl{30000};
  std::chrono::milliseconds initial_backoff{5};
  std::chrono::milliseconds max_backoff{200};
  std::uint32_t max_attempts{200};
  std::string holder_id;  // empty: "<host>:<pid>"
};

// Contents of a lock sentinel.
struct LockInfo {
  std::string holder_id;
  std::string token;
  pid_t pid{0};
  std::string host;
  std::int64_t acquired_at{0};  // ms since epoch
};

// Movable RAII handle for one held sentinel. Releasing twice is a no-op.
class LockToken {
public:
  LockToken() = default;
  ~LockToken();

  LockToken(LockToken&& other) noexcept;
  LockToken& operator=(LockToken&& other) noexcept;
  LockToken(const LockToken&) = delete;
  LockToken& operator=(const LockToken&) = delete;

  [[nodiscard]] auto held() const noexcept -> bool {
    return !token_.empty();
  }
  [[nodiscard]] auto resource() const noexcept
      -> const std::filesystem::path& {
    return resource_;
  }
  [[nodiscard]] auto token() const noexcept -> const std::string& {
    return token_;
  }

  auto release() -> Result<void>;

private:
  friend class LockManager;
  LockToken(std::filesystem::path resource, std::string token)
      : resource_(std::move(resource)), token_(std::move(token)) {}

  std::filesystem::path resource_;
  std::string token_;
};

// Cross-process mutual exclusion over a file: `<file>.lock` is created
// exclusively and deleted on release. Abandoned sentinels are broken after
// the staleness TTL, or at once when their holder pid is gone on this host.
class LockManager {
public:
  explicit LockManager(LockOptions options = {});

  [[nodiscard]] auto acquire(const std::filesystem::path& resource)
      -> Result<LockToken>;
  [[nodiscard]] auto acquire(const std::filesystem::path& resource,
                             std::chrono::milliseconds timeout)
      -> Result<LockToken>;

  auto release(LockToken& token) -> Result<void>;

  [[nodiscard]] auto current_holder(const std::filesystem::path& resource) const
      -> std::optional<LockInfo>;
  [[nodiscard]] auto is_stale(const std::filesystem::path& resource) const
      -> bool;

  [[nodiscard]] auto options() const noexcept -> const LockOptions& {
    return options_;
  }
  [[nodiscard]] auto holder_id() const noexcept -> const std::string& {
    return options_.holder_id;
  }

  [[nodiscard]] static auto sentinel_path(const std::filesystem::path& resource)
      -> std::filesystem::path;
  [[nodiscard]] static auto guard_path(const std::filesystem::path& resource)
      -> std::filesystem::path;

private:
  // true: created and owned; false: another sentinel exists.
  [[nodiscard]] auto try_create(const std::filesystem::path& sentinel,
                                const LockInfo& info) -> Result<bool>;
  [[nodiscard]] auto judge_stale(const std::filesystem::path& sentinel,
                                 const std::optional<LockInfo>& holder) const
      -> bool;
  [[nodiscard]] auto break_stale(const std::filesystem::path& resource,
                                 const std::optional<LockInfo>& judged)
      -> Result<bool>;

  LockOptions options_;
  std::string host_;
};

[[nodiscard]] auto local_hostname() -> std::string;
[[nodiscard]] auto is_process_alive(pid_t pid) -> bool;

}  // namespace agentboard
