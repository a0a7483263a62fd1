#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <spdlog/spdlog.h>

/**
 * @brief Shared "filesearch" logger writing to a colored stderr sink
 *
 * stdout stays free for search results. get() creates the logger at warn
 * level if init() was never called.
 */
class Logger {
public:
  static void init(spdlog::level::level_enum logLevel = spdlog::level::warn);

  static std::shared_ptr<spdlog::logger> get();

private:
  inline static std::shared_ptr<spdlog::logger> m_logger;
};

#endif // LOGGER_HPP
