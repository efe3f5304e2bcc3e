#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

#include "constants.hpp"

namespace tether::logging {
    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> shared_logger;

        std::call_once(once, []() {
            shared_logger = spdlog::get(constants::LOGGER_NAME);
            if (shared_logger == nullptr) {
                shared_logger = spdlog::stdout_color_mt(constants::LOGGER_NAME);
                shared_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
                shared_logger->set_level(spdlog::level::info);
            }
        });

        return shared_logger;
    }

    bool is_known_level(const std::string& level_name) {
        return level_name == "off" || spdlog::level::from_str(level_name) != spdlog::level::off;
    }

    void set_level(const std::string& level_name) {
        const auto level = spdlog::level::from_str(level_name);
        logger()->set_level(level);
    }
}  // namespace tether::logging
