#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

Sinks g_sinks;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_sinks.info = std::make_shared<spdlog::logger>("ftr.info", std::move(info_sink));
  g_sinks.error = std::make_shared<spdlog::logger>("ftr.error", std::move(error_sink));
  g_sinks.print = std::make_shared<spdlog::logger>("ftr.print", std::move(plain_out_sink));
  g_sinks.print_err = std::make_shared<spdlog::logger>("ftr.print_err", std::move(plain_err_sink));

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

const Sinks& sinks() {
  std::call_once(g_create_once, create_loggers);
  return g_sinks;
}

spdlog::logger* sink_for(LogChannel channel) {
  const auto& s = sinks();
  switch(channel) {
    case LogChannel::Print:    return s.print.get();
    case LogChannel::PrintErr: return s.print_err.get();
    case LogChannel::Error:    return s.error.get();
    default:                   return s.info.get();
  }
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Debug:    return "debug";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(channel, name_, level, message);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(channel);
  if(!sink) return;
  bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !prefix.empty()) {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
