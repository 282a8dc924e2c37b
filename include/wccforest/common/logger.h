#ifndef WCCFOREST_COMMON_LOGGER_H_
#define WCCFOREST_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace wccforest {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace wccforest

// Macros for convenient logging
#define WCCFOREST_TRACE(...) spdlog::trace(__VA_ARGS__)
#define WCCFOREST_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define WCCFOREST_INFO(...)  spdlog::info(__VA_ARGS__)
#define WCCFOREST_WARN(...)  spdlog::warn(__VA_ARGS__)
#define WCCFOREST_ERROR(...) spdlog::error(__VA_ARGS__)
#define WCCFOREST_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // WCCFOREST_COMMON_LOGGER_H_
