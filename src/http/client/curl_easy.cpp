//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_easy.hpp"

#include <curl/curl.h>

#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace tether::http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long WITH_PROGRESS = 0L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
        static constexpr long ENABLE = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_LENGTH = "content-length:";
        static constexpr const char* CONTENT_TYPE = "content-type:";
        static constexpr const char* ETAG = "etag:";
        static constexpr const char* LAST_MODIFIED = "last-modified:";
        static constexpr const char* CACHE_CONTROL = "cache-control:";
    };

    CurlEasy::CurlEasy(CurlOptions options) : handle_(curl_easy_init()), options_(std::move(options)) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        // nullptr resets a list left over from the previous request
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_ms_);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_response_headers_.clear();
        last_content_length_ = -1;
        last_etag_.clear();
        last_last_modified_.clear();
        last_content_type_.clear();
        last_cache_control_.clear();
        body.clear();

        // Always set these per request (don’t rely on old values)
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
    }

    void CurlEasy::set_method(const http::model::Request& req) {
        switch (req.method_) {
            case http::model::RequestType::GET:
                return;
            case http::model::RequestType::POST:
                setopt(CURLOPT_POST, CurlDefaults::ENABLE);
                break;
            case http::model::RequestType::PUT:
            case http::model::RequestType::PATCH:
            case http::model::RequestType::DELETE:
                setopt(CURLOPT_CUSTOMREQUEST, http::model::to_string(req.method_));
                break;
        }

        if (req.method_ == http::model::RequestType::POST || !req.body_.empty()) {
            setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_.size()));
            setopt(CURLOPT_POSTFIELDS, req.body_.c_str());
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        self->last_response_headers_.emplace_back(buffer, bytes);

        extract_header_value(buffer, bytes, HeaderKeys::CONTENT_LENGTH, self->last_content_length_);
        extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, self->last_content_type_);
        extract_header_value(buffer, bytes, HeaderKeys::ETAG, self->last_etag_);
        extract_header_value(buffer, bytes, HeaderKeys::LAST_MODIFIED, self->last_last_modified_);
        extract_header_value(buffer, bytes, HeaderKeys::CACHE_CONTROL, self->last_cache_control_);

        return bytes;
    }

    int CurlEasy::progress_cb(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* cancelled = static_cast<const std::atomic<bool>*>(clientp);
        // non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        return cancelled->load() ? 1 : 0;
    }

    http::model::Response CurlEasy::perform(const http::model::Request& req, const std::atomic<bool>& cancelled) {
        if (cancelled.load()) {
            throw http_error::HttpError(http_error::ErrorKind::CANCELLED, req.url_, "Request cancelled before it started");
        }

        set_url(req.url_);
        set_headers(req.headers_);

        std::string body;
        prepare_for_new_request(body);
        set_method(req);

        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::progress_cb);
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(const_cast<std::atomic<bool>*>(&cancelled)));
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::WITH_PROGRESS);

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            throw http_error::HttpError(http_error::ErrorKind::CANCELLED, url, "Request cancelled");
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http_error::HttpError(http_error::ErrorKind::TRANSPORT, url, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_length_ = last_content_length_;
        r.etag_ = std::move(last_etag_);
        r.last_modified_ = std::move(last_last_modified_);
        r.content_type_ = std::move(last_content_type_);
        r.cache_control_ = std::move(last_cache_control_);
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            const char a = buffer[i];
            const char b = key[i];
            if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char* start = buffer + key_len;
        const char* end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, long& out_property) {
        std::string tmp;
        if (!extract_header_value(buffer, bytes, key, tmp)) {
            return false;
        }
        char* end_ptr = nullptr;
        long val = std::strtol(tmp.c_str(), &end_ptr, constants::BASE_10);
        if (end_ptr == tmp.c_str()) {
            return false;
        }
        out_property = val;
        return true;
    }

}  // namespace tether::http::client
