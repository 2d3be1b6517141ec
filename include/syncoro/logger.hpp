#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <string_view>
#include <version>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace syncoro {
namespace format_impl = std;
}  // namespace syncoro
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace syncoro {
namespace format_impl = fmt;
}  // namespace syncoro
#endif

namespace syncoro {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  switch (level) {
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
  }
  return "unknown";
}

struct log_context {
  log_level level;
  // Connection name (config::name); empty for messages not tied to a connection.
  std::string_view source;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

/// Process-wide logger shared by every connection.
///
/// The sink may be invoked from the worker thread and from caller threads concurrently;
/// a custom sink must be thread-safe.
class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  // IMPORTANT: install the sink before any connection is started.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn != nullptr) {
      log_fn_ = fn;
      log_user_data_ = user_data;
      return;
    }

    log_fn_ = &default_log_function;
    log_user_data_ = nullptr;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] auto get_log_level() const -> log_level {
    return min_level_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(log_level level) const -> bool {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view source, std::string_view message,
           std::string_view file, int line) {
    if (!enabled(level)) {
      return;
    }

    if (log_fn_) {
      log_context ctx{
        .level = level,
        .source = source,
        .message = message,
        .file = file,
        .line = line,
        .timestamp = std::chrono::system_clock::now(),
      };
      log_fn_(log_user_data_, ctx);
    }
  }

  template <typename... Args>
  void log(log_level level, std::string_view source, std::string_view file, int line,
           format_impl::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) {
      return;
    }

    auto message = format_impl::format(fmt, std::forward<Args>(args)...);
    log(level, source, message, file, line);
  }

 private:
  // Silent until the user opts in.
  logger() : log_fn_(&default_log_function), log_user_data_(nullptr), min_level_(log_level::off) {}

  static void default_log_function(void*, log_context const& ctx) {
    auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                ctx.timestamp.time_since_epoch()) % 1000;

    // Show the path below `syncoro/` when possible, the basename otherwise.
    auto file = [&]() -> std::string_view {
      auto path = ctx.file;
      constexpr std::string_view k_prefix = "syncoro/";
      if (auto pos = path.rfind(k_prefix); pos != std::string_view::npos) {
        return path.substr(pos + k_prefix.size());
      }
      if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
        return path.substr(pos + 1);
      }
      return path;
    }();

    // [time] [syncoro] [level] [connection] [file:line] message
    auto formatted = format_impl::format(
      "[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] [syncoro] [{}]{}{}{} [{}:{}] {}",
      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
      static_cast<int>(ms.count()), to_string(ctx.level), ctx.source.empty() ? "" : " [",
      ctx.source, ctx.source.empty() ? "" : "]", file, ctx.line, ctx.message);

    std::cerr << formatted << std::endl;
  }

  log_function log_fn_;
  void* log_user_data_;
  std::atomic<log_level> min_level_;
};

inline auto get_logger() -> logger& { return logger::instance(); }

// IMPORTANT: install the sink before any connection is started.
inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace syncoro

// Library-wide messages.
#define SYNCORO_LOG_DEBUG(fmt, ...) \
  SYNCORO_LOG_DEBUG_FOR(::std::string_view{}, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SYNCORO_LOG_INFO(fmt, ...) \
  SYNCORO_LOG_INFO_FOR(::std::string_view{}, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SYNCORO_LOG_WARNING(fmt, ...) \
  SYNCORO_LOG_WARNING_FOR(::std::string_view{}, fmt __VA_OPT__(, ) __VA_ARGS__)
#define SYNCORO_LOG_ERROR(fmt, ...) \
  SYNCORO_LOG_ERROR_FOR(::std::string_view{}, fmt __VA_OPT__(, ) __VA_ARGS__)

// Messages about one connection; `source` is its config::name.
#define SYNCORO_LOG_DEBUG_FOR(source, fmt, ...)                                         \
  ::syncoro::get_logger().log(::syncoro::log_level::debug, source, __FILE__, __LINE__, \
                              fmt __VA_OPT__(, ) __VA_ARGS__)

#define SYNCORO_LOG_INFO_FOR(source, fmt, ...)                                         \
  ::syncoro::get_logger().log(::syncoro::log_level::info, source, __FILE__, __LINE__, \
                              fmt __VA_OPT__(, ) __VA_ARGS__)

#define SYNCORO_LOG_WARNING_FOR(source, fmt, ...)                                         \
  ::syncoro::get_logger().log(::syncoro::log_level::warning, source, __FILE__, __LINE__, \
                              fmt __VA_OPT__(, ) __VA_ARGS__)

#define SYNCORO_LOG_ERROR_FOR(source, fmt, ...)                                         \
  ::syncoro::get_logger().log(::syncoro::log_level::error, source, __FILE__, __LINE__, \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
