//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_STRING_UTILS_HPP
#define TETHER_STRING_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace tether::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);

    bool starts_with_scheme(std::string_view sv);

    std::string to_hex(size_t value);
}  // namespace tether::string_utils

#endif
