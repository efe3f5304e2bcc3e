#ifndef TETHER_URL_HPP
#define TETHER_URL_HPP

#include <string>
#include <string_view>

namespace tether::http::url {
    // Joins base_url and path, or takes path as-is when it is already absolute, and validates the result.
    // Throws HttpError(INVALID_URL) instead of ever producing a malformed URL.
    std::string compose(const std::string& base_url, const std::string& path);

    [[nodiscard]] bool is_valid(const std::string& url);

    std::string percent_encode(std::string_view text);

    std::string append_query(const std::string& url, const std::string& query);
}  // namespace tether::http::url

#endif
