//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_MODEL_HPP
#define TETHER_MODEL_HPP

#include <string>
#include <vector>

namespace tether::http::model {
    enum class RequestType {
        GET,
        POST,
        PUT,
        PATCH,
        DELETE,
    };

    enum class ParameterType {
        NONE,
        FORM_URL_ENCODED,
        JSON,
        MULTIPART_FORM_DATA,
        CUSTOM,
    };

    enum class ResponseType {
        JSON,
        IMAGE,
        DATA,
    };

    enum class CachingLevel {
        NONE,
        MEMORY,
        MEMORY_AND_FILE,
    };

    struct FormDataPart {
        std::string data_;
        std::string parameter_name_;
        std::string filename_;
        std::string content_type_ = "application/octet-stream";

        bool operator==(const FormDataPart& other) const = default;
    };

    struct Request {
        std::string url_;
        RequestType method_ = RequestType::GET;
        std::string body_;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;
        long content_length_ = -1;

        std::string body_;
        std::string effective_url_;

        std::string etag_;
        std::string last_modified_;
        std::string cache_control_;
        std::string content_type_;

        std::vector<std::string> headers_;
    };

    const char* to_string(RequestType type);
    const char* to_string(ResponseType type);
    const char* to_string(CachingLevel level);
}  // namespace tether::http::model

#endif
