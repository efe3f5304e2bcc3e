#ifndef TETHER_CONSTANTS_HPP
#define TETHER_CONSTANTS_HPP

#include <cstddef>

namespace tether::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr std::size_t ERROR_MESSAGE_LENGTH = 512;
    inline constexpr std::size_t BOUNDARY_RANDOM_LENGTH = 16;
    inline constexpr const char* LOGGER_NAME = "tether";
    inline constexpr const char* MULTIPART_BOUNDARY_PREFIX = "tether.boundary.";
}  // namespace tether::constants

#endif
