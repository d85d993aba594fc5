#ifndef SEGSTORE_COMMON_LOGGER_H_
#define SEGSTORE_COMMON_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace segstore {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Named logger sharing the default logger's sinks
     *
     * Created on first use; later calls return the registered instance.
     */
    static std::shared_ptr<spdlog::logger> Get(const std::string& name);
};

} // namespace common
} // namespace segstore

// Macros for convenient logging
#define SEGSTORE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SEGSTORE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SEGSTORE_INFO(...)  spdlog::info(__VA_ARGS__)
#define SEGSTORE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define SEGSTORE_ERROR(...) spdlog::error(__VA_ARGS__)
#define SEGSTORE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // SEGSTORE_COMMON_LOGGER_H_
