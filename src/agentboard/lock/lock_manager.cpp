#include "agentboard/lock/lock_manager.hpp"

#include "agentboard/util/log.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>
#include <thread>
#include <utility>

namespace agentboard {

namespace {

using namespace std::chrono_literals;

enum class SentinelState : std::uint8_t {
  Missing,
  Unreadable,
  Held,
};

struct Sentinel {
  SentinelState state{SentinelState::Missing};
  std::optional<LockInfo> info;
};

auto now_millis() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

auto random_token() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint64_t> dis;
  return fmt::format("{:016x}{:016x}", dis(gen), dis(gen));
}

auto jitter(std::chrono::milliseconds backoff) -> std::chrono::milliseconds {
  if (backoff.count() < 2) {
    return 0ms;
  }
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<std::int64_t> dis(0, backoff.count() / 2);
  return std::chrono::milliseconds{dis(gen)};
}

auto to_json(const LockInfo& info) -> nlohmann::json {
  return nlohmann::json{{"holder_id", info.holder_id},
                        {"token", info.token},
                        {"pid", info.pid},
                        {"host", info.host},
                        {"acquired_at", info.acquired_at}};
}

auto read_sentinel(const std::filesystem::path& sentinel) -> Sentinel {
  std::ifstream in(sentinel, std::ios::binary);
  if (!in) {
    std::error_code ec;
    return Sentinel{std::filesystem::exists(sentinel, ec)
                        ? SentinelState::Unreadable
                        : SentinelState::Missing,
                    std::nullopt};
  }
  std::string text{std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>()};
  try {
    auto j = nlohmann::json::parse(text);
    LockInfo info;
    info.holder_id = j.at("holder_id").get<std::string>();
    info.token = j.at("token").get<std::string>();
    info.pid = j.at("pid").get<pid_t>();
    info.host = j.at("host").get<std::string>();
    info.acquired_at = j.at("acquired_at").get<std::int64_t>();
    if (info.token.empty()) {
      return Sentinel{SentinelState::Unreadable, std::nullopt};
    }
    return Sentinel{SentinelState::Held, std::move(info)};
  } catch (const nlohmann::json::exception&) {
    // A holder that died between create and write leaves an empty file.
    return Sentinel{SentinelState::Unreadable, std::nullopt};
  }
}

auto mtime_millis(const std::filesystem::path& path)
    -> std::optional<std::int64_t> {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
         st.st_mtim.tv_nsec / 1'000'000;
}

auto describe(const std::optional<LockInfo>& info) -> std::string {
  if (!info) {
    return "unknown holder";
  }
  return fmt::format("{} (pid {} on {})", info->holder_id, info->pid,
                     info->host);
}

// Held for the few syscalls that check and delete a sentinel, so that a
// breaker and a releasing holder never both act on the same file.
class GuardLock {
public:
  explicit GuardLock(const std::filesystem::path& path)
      : fd_(::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644)) {
    if (fd_ < 0) {
      return;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno != EINTR) {
        ::close(fd_);
        fd_ = -1;
        return;
      }
    }
  }
  ~GuardLock() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }
  GuardLock(const GuardLock&) = delete;
  GuardLock& operator=(const GuardLock&) = delete;

  [[nodiscard]] auto ok() const noexcept -> bool {
    return fd_ >= 0;
  }

private:
  int fd_{-1};
};

auto remove_sentinel(const std::filesystem::path& sentinel) -> Result<void> {
  if (::unlink(sentinel.c_str()) != 0 && errno != ENOENT) {
    return fail(Error::IoError,
                fmt::format("cannot remove {}: {}", sentinel.string(),
                            std::strerror(errno)));
  }
  return ok();
}

auto release_sentinel(const std::filesystem::path& resource,
                      const std::string& token) -> Result<void> {
  GuardLock guard(LockManager::guard_path(resource));
  if (!guard.ok()) {
    return fail(Error::IoError,
                fmt::format("cannot open lock guard for {}: {}",
                            resource.string(), std::strerror(errno)));
  }

  auto sentinel = LockManager::sentinel_path(resource);
  auto current = read_sentinel(sentinel);
  if (current.state == SentinelState::Missing) {
    log::warn("Lock on {} was already removed before release",
              resource.string());
    return ok();
  }
  if (current.state != SentinelState::Held || current.info->token != token) {
    log::warn("Lock on {} was broken while held; now held by {}, leaving it",
              resource.string(), describe(current.info));
    return ok();
  }
  return remove_sentinel(sentinel);
}

}  // namespace

auto local_hostname() -> std::string {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "localhost";
  }
  return buf;
}

auto is_process_alive(pid_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

LockToken::~LockToken() {
  if (auto r = release(); !r) {
    log::error("Failed to release lock on {}: {}", resource_.string(),
               r.error().message());
  }
}

LockToken::LockToken(LockToken&& other) noexcept
    : resource_(std::move(other.resource_)),
      token_(std::exchange(other.token_, {})) {}

LockToken& LockToken::operator=(LockToken&& other) noexcept {
  if (this != &other) {
    if (auto r = release(); !r) {
      log::error("Failed to release lock on {}: {}", resource_.string(),
                 r.error().message());
    }
    resource_ = std::move(other.resource_);
    token_ = std::exchange(other.token_, {});
  }
  return *this;
}

auto LockToken::release() -> Result<void> {
  if (token_.empty()) {
    return ok();
  }
  auto token = std::exchange(token_, {});
  auto r = release_sentinel(resource_, token);
  if (r) {
    log::trace("Released lock on {}", resource_.string());
  }
  return r;
}

LockManager::LockManager(LockOptions options)
    : options_(std::move(options)), host_(local_hostname()) {
  if (options_.holder_id.empty()) {
    options_.holder_id = fmt::format("{}:{}", host_, ::getpid());
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

auto LockManager::sentinel_path(const std::filesystem::path& resource)
    -> std::filesystem::path {
  auto p = resource;
  p += ".lock";
  return p;
}

auto LockManager::guard_path(const std::filesystem::path& resource)
    -> std::filesystem::path {
  auto p = resource;
  p += ".lock.guard";
  return p;
}

auto LockManager::acquire(const std::filesystem::path& resource)
    -> Result<LockToken> {
  return acquire(resource, options_.timeout);
}

auto LockManager::acquire(const std::filesystem::path& resource,
                          std::chrono::milliseconds timeout)
    -> Result<LockToken> {
  auto sentinel = sentinel_path(resource);
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto backoff = std::max(options_.initial_backoff, 1ms);

  LockInfo info;
  info.holder_id = options_.holder_id;
  info.token = random_token();
  info.pid = ::getpid();
  info.host = host_;

  std::optional<LockInfo> last_holder;
  for (std::uint32_t attempt = 1;; ++attempt) {
    info.acquired_at = now_millis();
    auto created = try_create(sentinel, info);
    if (!created) {
      return std::unexpected(created.error());
    }
    if (*created) {
      log::trace("Acquired lock on {} after {} attempt(s)", resource.string(),
                 attempt);
      return LockToken{resource, info.token};
    }

    auto current = read_sentinel(sentinel);
    last_holder = current.info;
    if (current.state != SentinelState::Missing &&
        judge_stale(sentinel, current.info)) {
      auto broken = break_stale(resource, current.info);
      if (!broken) {
        return std::unexpected(broken.error());
      }
      if (*broken) {
        continue;
      }
    }

    auto now = std::chrono::steady_clock::now();
    if (attempt >= options_.max_attempts || now >= deadline) {
      return fail(Error::LockTimeout,
                  fmt::format("gave up on {} after {} attempt(s); held by {}",
                              resource.string(), attempt,
                              describe(last_holder)));
    }

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(backoff + jitter(backoff), remaining));
    backoff = std::min(backoff * 2, std::max(options_.max_backoff, backoff));
  }
}

auto LockManager::release(LockToken& token) -> Result<void> {
  return token.release();
}

auto LockManager::current_holder(const std::filesystem::path& resource) const
    -> std::optional<LockInfo> {
  return read_sentinel(sentinel_path(resource)).info;
}

auto LockManager::is_stale(const std::filesystem::path& resource) const
    -> bool {
  auto sentinel = sentinel_path(resource);
  auto current = read_sentinel(sentinel);
  if (current.state == SentinelState::Missing) {
    return false;
  }
  return judge_stale(sentinel, current.info);
}

auto LockManager::try_create(const std::filesystem::path& sentinel,
                             const LockInfo& info) -> Result<bool> {
  int fd = ::open(sentinel.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                  0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      return false;
    }
    return fail(Error::IoError,
                fmt::format("cannot create {}: {}", sentinel.string(),
                            std::strerror(errno)));
  }

  auto payload = to_json(info).dump();
  const char* data = payload.data();
  std::size_t left = payload.size();
  while (left > 0) {
    auto n = ::write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int saved = errno;
      ::close(fd);
      ::unlink(sentinel.c_str());
      return fail(Error::IoError, fmt::format("cannot write {}: {}",
                                              sentinel.string(),
                                              std::strerror(saved)));
    }
    data += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    log::warn("fsync of {} failed: {}", sentinel.string(),
              std::strerror(errno));
  }
  ::close(fd);
  return true;
}

auto LockManager::judge_stale(const std::filesystem::path& sentinel,
                              const std::optional<LockInfo>& holder) const
    -> bool {
  auto ttl = options_.stale_ttl.count();
  auto now = now_millis();
  if (!holder) {
    auto mtime = mtime_millis(sentinel);
    return mtime && now - *mtime > ttl;
  }
  if (now - holder->acquired_at > ttl) {
    return true;
  }
  return holder->host == host_ && !is_process_alive(holder->pid);
}

auto LockManager::break_stale(const std::filesystem::path& resource,
                              const std::optional<LockInfo>& judged)
    -> Result<bool> {
  GuardLock guard(guard_path(resource));
  if (!guard.ok()) {
    return fail(Error::IoError,
                fmt::format("cannot open lock guard for {}: {}",
                            resource.string(), std::strerror(errno)));
  }

  // Re-read under the guard: only the sentinel that was judged may go.
  auto sentinel = sentinel_path(resource);
  auto current = read_sentinel(sentinel);
  bool same = false;
  if (judged) {
    same = current.state == SentinelState::Held &&
           current.info->token == judged->token;
  } else {
    same = current.state == SentinelState::Unreadable &&
           judge_stale(sentinel, std::nullopt);
  }
  if (!same) {
    return false;
  }

  if (judged) {
    log::warn("Breaking stale lock on {} held by {} since {} ms ago",
              resource.string(), describe(judged),
              now_millis() - judged->acquired_at);
  } else {
    log::warn("Breaking unreadable stale lock on {}", resource.string());
  }
  if (auto r = remove_sentinel(sentinel); !r) {
    return std::unexpected(r.error());
  }
  return true;
}

}  // namespace agentboard
