//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_CURL_EASY_HPP
#define TETHER_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace tether::http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    struct CurlOptions {
        std::string user_agent_ = "tether/0.1 libcurl";
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
    };

    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(CurlOptions options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response perform(const http::model::Request& req, const std::atomic<bool>& cancelled) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void enable_keepalive();
        void enable_compression();

        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, long& out_property);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        void set_method(const http::model::Request& req);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int progress_cb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        long last_content_length_ = -1;

        std::string last_etag_;
        std::string last_last_modified_;
        std::string last_content_type_;
        std::string last_cache_control_;

        std::vector<std::string> last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        CurlOptions options_;
    };
}  // namespace tether::http::client

#endif
