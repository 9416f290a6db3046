#include "mmdv/core/logger.hpp"

namespace mmdv::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger = std::make_shared<spdlog::logger>("mmdv", consoleSink);

  logger->set_pattern(pattern);

#ifdef DEBUG
  logger->set_level(spdlog::level::debug);
#else
  logger->set_level(spdlog::level::info);
#endif

  spdlog::register_logger(logger);
  sLogger = logger;

  info("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

void Logger::setLevel(LogLevel level) {
  if (sLogger) {
    sLogger->set_level(static_cast<spdlog::level::level_enum>(level));
  }
}

LogLevel Logger::getLevel() {
  if (!sLogger) {
    return LogLevel::Off;
  }
  return static_cast<LogLevel>(sLogger->level());
}

} // namespace mmdv::core
