//
// Created by Daniel Griffiths on 11/1/25.
//

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace tether::string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::filesystem::path append_to_path(const std::filesystem::path &path, const std::string &str) { return {path.string() + str}; }

    bool starts_with_scheme(std::string_view sv) {
        static constexpr const char *HTTP_SCHEME = "http://";
        static constexpr const char *HTTPS_SCHEME = "https://";
        return ieq_prefix(sv.data(), sv.size(), HTTP_SCHEME) || ieq_prefix(sv.data(), sv.size(), HTTPS_SCHEME);
    }

    std::string to_hex(size_t value) {
        std::ostringstream oss;
        oss << std::hex << std::setw(sizeof(size_t) * 2) << std::setfill('0') << value;
        return oss.str();
    }
}  // namespace tether::string_utils
