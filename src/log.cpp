#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

// Diagnostics go to stderr so that stdout carries only the result lines.
void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("xdcc.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("xdcc.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("xdcc.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("xdcc.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() : listeners_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)), listeners_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerTable> listeners)
  : name_(std::move(name)), listeners_(std::move(listeners)) {}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) {
  std::string child_name = name_.empty() ? suffix : name_ + "/" + suffix;
  return std::shared_ptr<Logger>(new Logger(std::move(child_name), listeners_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  const auto id = listeners_->next_id++;
  listeners_->bindings.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->bindings.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->bindings.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listeners_->mutex);
    if(listeners_->bindings.empty()) return false;
    snapshot.reserve(listeners_->bindings.size());
    for(const auto& entry : listeners_->bindings) {
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
      detail::emit_to_default("error", name_, spdlog::level::err,
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, name_, level, message);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  bool decorate = true;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
    decorate = false;
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
    decorate = false;
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(decorate && !logger_name.empty()) {
    sink->log(level, fmt::format("[{}] {}", logger_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
