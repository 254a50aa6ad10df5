#include "diagram_stream.hpp"

#include <spdlog/sinks/stdout_sinks.h>

namespace diagram_stream {

// ---------------- Logging ----------------

namespace {

std::shared_ptr<spdlog::logger> make_default_logger() {
  auto l = std::make_shared<spdlog::logger>("diagram_stream", std::make_shared<spdlog::sinks::stderr_sink_mt>());
  l->set_level(spdlog::level::info);
  l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
  return l;
}

struct LoggerSlot {
  std::mutex mu;
  std::shared_ptr<spdlog::logger> current{make_default_logger()};
};

LoggerSlot& logger_slot() {
  static LoggerSlot slot;
  return slot;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  auto& slot = logger_slot();
  std::lock_guard<std::mutex> lock(slot.mu);
  return slot.current;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
  auto& slot = logger_slot();
  std::lock_guard<std::mutex> lock(slot.mu);
  slot.current = replacement ? std::move(replacement) : make_default_logger();
}

}  // namespace diagram_stream
