#include "segstore/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <mutex>

namespace segstore {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::Get(const std::string& name) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::default_logger()->clone(name);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger registration failed for " << name << ": " << ex.what() << std::endl;
    }
    return logger;
}

} // namespace common
} // namespace segstore
