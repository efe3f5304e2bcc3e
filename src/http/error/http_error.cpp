//
// Created by Daniel Griffiths on 11/1/25.
//

#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace tether::http::http_error {
    HttpError::HttpError(ErrorKind k, long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), kind_(k), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    HttpError::HttpError(ErrorKind k, std::string u, const std::string &msg) : HttpError(k, 0, std::move(u), std::string{}, msg) {}

    const char *to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ENCODING:
                return "encoding";
            case ErrorKind::TRANSPORT:
                return "transport";
            case ErrorKind::CANCELLED:
                return "cancelled";
            case ErrorKind::DECODING:
                return "decoding";
            case ErrorKind::INVALID_URL:
                return "invalid_url";
        }
        return "transport";
    }
};  // namespace tether::http::http_error
