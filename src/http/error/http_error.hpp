//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_HTTP_ERROR_HPP
#define TETHER_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tether::http::http_error {
    enum class ErrorKind {
        ENCODING,
        TRANSPORT,
        CANCELLED,
        DECODING,
        INVALID_URL,
    };

    const char* to_string(ErrorKind kind);

    struct HttpError : public std::runtime_error {
        ErrorKind kind_;
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(ErrorKind k, long s, std::string u, std::string preview, const std::string &msg);
        explicit HttpError(ErrorKind k, std::string u, const std::string &msg);

        [[nodiscard]] bool is_cancelled() const { return kind_ == ErrorKind::CANCELLED; }
    };
}  // namespace tether::http::http_error

#endif
