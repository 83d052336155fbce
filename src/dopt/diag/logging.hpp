#pragma once

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dopt::diag {

inline spdlog::logger &dopt_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("dopt");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("dopt", sink);
      lg->set_level(spdlog::level::warn);
      if (const char *env = std::getenv("DOPT_LOG"); env != nullptr) {
        lg->set_level(spdlog::level::from_str(env));
      }
      lg->set_pattern("[%^%-5l%$ dopt] %v");
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline void set_log_level(spdlog::level::level_enum level) {
  dopt_logger().set_level(level);
}

#define DOPT_TRACE(...) ::dopt::diag::dopt_logger().trace(__VA_ARGS__)
#define DOPT_DEBUG(...) ::dopt::diag::dopt_logger().debug(__VA_ARGS__)
#define DOPT_INFO(...) ::dopt::diag::dopt_logger().info(__VA_ARGS__)
#define DOPT_WARN(...) ::dopt::diag::dopt_logger().warn(__VA_ARGS__)
#define DOPT_ERROR(...) ::dopt::diag::dopt_logger().error(__VA_ARGS__)

} // namespace dopt::diag
