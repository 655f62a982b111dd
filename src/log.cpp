#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_out_logger;
std::shared_ptr<spdlog::logger> g_err_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::mutex g_create_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            spdlog::level::level_enum flush_level) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  // A test binary may create several nodes; the registry keeps the first.
  if(!spdlog::get(name)) {
    spdlog::register_logger(logger);
  }
  return logger;
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_create_mutex);
  if(g_out_logger) return;

  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern(kTimestampPattern);
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern(kTimestampPattern);
  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");
  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_out_logger = make_logger("lansync.out", std::move(out_sink), spdlog::level::warn);
  g_err_logger = make_logger("lansync.err", std::move(err_sink), spdlog::level::err);
  g_print_logger = make_logger("lansync.print", std::move(plain_out_sink), spdlog::level::info);
  g_print_err_logger = make_logger("lansync.print_err", std::move(plain_err_sink), spdlog::level::err);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() : listeners_(std::make_shared<ListenerSet>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)), listeners_(std::make_shared<ListenerSet>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerSet> listeners)
  : name_(std::move(name)), listeners_(std::move(listeners)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) {
  auto base = name();
  auto logger = std::shared_ptr<Logger>(
    new Logger(base.empty() ? suffix : base + "/" + suffix, listeners_));
  logger->set_level(level());
  return logger;
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

std::string Logger::prefixed(const char* channel) const {
  auto base = name();
  if(base.empty()) return channel;
  return base + ":" + channel;
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
      detail::emit_to_default("error", "log-listener", spdlog::level::err,
                              std::string("listener threw: ") + e.what());
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_out_logger->set_level(level);
  g_err_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_out_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  ensure_loggers();

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(level >= spdlog::level::err) {
    sink = g_err_logger.get();
  } else {
    sink = g_out_logger.get();
  }

  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
