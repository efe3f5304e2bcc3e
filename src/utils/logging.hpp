#ifndef TETHER_LOGGING_HPP
#define TETHER_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tether::logging {
    // Shared "tether" logger, created with a colour stdout sink on first use.
    std::shared_ptr<spdlog::logger> logger();

    // spdlog maps unrecognised names to "off"; only "off" itself may mean that.
    bool is_known_level(const std::string& level_name);

    void set_level(const std::string& level_name);
}  // namespace tether::logging

#endif
