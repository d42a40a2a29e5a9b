
#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string_view>

namespace tether::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static void init_logger(std::shared_ptr<spdlog::logger> instance_) {
  assert(instance_);
  instance = std::move(instance_);
}

/// @private
static void apply_environment_override() {
  const char* env_variable = "LOG_LEVEL_OVERRIDE";
  const char* log_level = std::getenv(env_variable);
  if (log_level == nullptr)
    return;
  const auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != std::string_view{"off"}) {
    instance->error("failed to set log level from environment variable {}={}", env_variable,
                    log_level);
  } else {
    instance->set_level(level);
  }
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    init_logger(spdlog::stdout_color_mt("tether"));
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    apply_environment_override();
  });

  assert(instance);
  return *instance;
}

} // namespace tether::logging
