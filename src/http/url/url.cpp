#include "url.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace tether::http::url {
    namespace {
        struct CurlUrlDeleter {
            void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
        };

        constexpr std::string_view HEX_DIGITS = "0123456789ABCDEF";

        bool is_unreserved(unsigned char c) { return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~'; }

        bool has_forbidden_characters(std::string_view sv) {
            for (const unsigned char c : sv) {
                if (std::iscntrl(c) != 0 || std::isspace(c) != 0) {
                    return true;
                }
            }
            return false;
        }
    }  // namespace

    bool is_valid(const std::string& url) {
        if (url.empty() || has_forbidden_characters(url) || !string_utils::starts_with_scheme(url)) {
            return false;
        }

        std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
        if (handle == nullptr) {
            return false;
        }

        const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK) {
            return false;
        }

        char* host = nullptr;
        if (curl_url_get(handle.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK) {
            return false;
        }
        const bool has_host = host != nullptr && host[0] != '\0';
        curl_free(host);
        return has_host;
    }

    std::string compose(const std::string& base_url, const std::string& path) {
        std::string composed = string_utils::starts_with_scheme(path) ? path : base_url + path;

        if (!is_valid(composed)) {
            throw http_error::HttpError(http_error::ErrorKind::INVALID_URL, composed, "Malformed URL composed from base '" + base_url + "' and path '" + path + "'");
        }

        return composed;
    }

    std::string percent_encode(std::string_view text) {
        std::string out;
        out.reserve(text.size());

        for (const unsigned char c : text) {
            if (is_unreserved(c)) {
                out.push_back(static_cast<char>(c));
                continue;
            }
            out.push_back('%');
            out.push_back(HEX_DIGITS[c / constants::BASE_16]);
            out.push_back(HEX_DIGITS[c % constants::BASE_16]);
        }

        return out;
    }

    std::string append_query(const std::string& url, const std::string& query) {
        if (query.empty()) {
            return url;
        }

        const char separator = url.find('?') == std::string::npos ? '?' : '&';
        return url + separator + query;
    }
}  // namespace tether::http::url
