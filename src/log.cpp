#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

std::shared_ptr<spdlog::logger> g_out_logger;
std::shared_ptr<spdlog::logger> g_err_logger;
std::shared_ptr<spdlog::logger> g_plain_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  std::call_once(g_create_once, [](){
    auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    out_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    err_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto plain_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    plain_sink->set_pattern("%v");

    g_out_logger = std::make_shared<spdlog::logger>("landrop.out", std::move(out_sink));
    g_err_logger = std::make_shared<spdlog::logger>("landrop.err", std::move(err_sink));
    g_plain_logger = std::make_shared<spdlog::logger>("landrop.print", std::move(plain_sink));

    g_out_logger->set_level(spdlog::level::info);
    g_err_logger->set_level(spdlog::level::warn);
    g_plain_logger->set_level(spdlog::level::info);

    g_out_logger->flush_on(spdlog::level::info);
    g_err_logger->flush_on(spdlog::level::warn);
    g_plain_logger->flush_on(spdlog::level::info);
  });
}

} // namespace

void init_logging(bool verbose) {
  create_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_out_logger->set_level(level);
  spdlog::set_default_logger(g_out_logger);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard lg(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lg(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lg(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard lg(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::write_default(spdlog::level::warn, channel,
                            fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(spdlog::level::level_enum level, const std::string& message) {
  auto channel = name();
  if(dispatch(channel, level, message)) return;
  detail::write_default(level, channel, message);
}

void Logger::emit_plain(const std::string& message) {
  if(dispatch(name(), spdlog::level::info, message)) return;
  detail::write_plain(message);
}

namespace detail {

void write_default(spdlog::level::level_enum level,
                   const std::string& channel,
                   const std::string& message) {
  create_loggers();
  if(!log_passthrough()) return;
  auto* sink = level >= spdlog::level::warn ? g_err_logger.get() : g_out_logger.get();
  if(channel.empty()) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", channel, message));
  }
}

void write_plain(const std::string& message) {
  create_loggers();
  if(!log_passthrough()) return;
  g_plain_logger->info(message);
}

} // namespace detail
