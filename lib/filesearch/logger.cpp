#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

void Logger::init(spdlog::level::level_enum logLevel) {
  if (!m_logger) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    m_logger = std::make_shared<spdlog::logger>("filesearch", consoleSink);
    m_logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  }

  m_logger->set_level(logLevel);
  m_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!m_logger) {
    init();
  }
  return m_logger;
}
