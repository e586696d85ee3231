#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace agentboard::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn" || name == "warning") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

// Agents are short-lived processes, so lines are written synchronously:
// a line logged right before a crash must already be on disk.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex mu_;
  std::FILE* sink_{nullptr};
  bool color_{true};

  auto write(Level level, std::string_view message) -> void {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::lock_guard lock(mu_);
    std::FILE* out = sink_ ? sink_ : stderr;
    bool color = color_ && sink_ == nullptr;
    fmt::print(out, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
               color ? level_color(level) : "", level_name(level),
               color ? "\033[0m" : "", tid, message);
    std::fflush(out);
  }

public:
  Logger() = default;
  ~Logger() {
    close_file();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_color(bool enabled) -> void {
    std::lock_guard lock(mu_);
    color_ = enabled;
  }

  // Appends to `path`; returns false (and keeps logging to stderr) when the
  // file cannot be opened.
  [[nodiscard]] auto open_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::lock_guard lock(mu_);
    if (sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    return true;
  }

  auto close_file() -> void {
    std::lock_guard lock(mu_);
    if (sink_) {
      std::fclose(sink_);
      sink_ = nullptr;
    }
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;
    try {
      write(level, fmt::format(fmt, std::forward<Args>(args)...));
    } catch (const std::exception& e) {
      std::fprintf(stderr, "agentboard: log formatting failed: %s\n",
                   e.what());
    }
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

template <typename... Args>
auto trace(fmt::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace agentboard::log
