#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Output channels. info/warn/debug go to the timestamped stdout sink, error to
// stderr, print/print_err are plain lines meant for the operator.
enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* channel_name(LogChannel channel);

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true from a listener suppresses the default sink for that line.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Info, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Warn, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Debug, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(LogChannel channel,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    std::string tagged = name_.empty()
      ? std::string(channel_name(channel))
      : name_ + ":" + channel_name(channel);
    if(dispatch(tagged, level, formatted)) return;
    emit(channel, level, formatted);
  }

  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);
  void emit(LogChannel channel,
            spdlog::level::level_enum level,
            const std::string& message) const;

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(LogChannel channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message);
} // namespace detail

// Free helpers for code that may or may not have a Logger at hand.
template<typename... Args>
inline void log_info(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->info(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Info, "", spdlog::level::info,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Warn, "", spdlog::level::warn,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_error(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Error, "", spdlog::level::err,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_debug(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->debug(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Debug, "", spdlog::level::debug,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::Print, "", spdlog::level::info,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::PrintErr, "", spdlog::level::err,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}
