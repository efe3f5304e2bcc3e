#include "model.hpp"

namespace tether::http::model {
    const char* to_string(RequestType type) {
        switch (type) {
            case RequestType::GET:
                return "GET";
            case RequestType::POST:
                return "POST";
            case RequestType::PUT:
                return "PUT";
            case RequestType::PATCH:
                return "PATCH";
            case RequestType::DELETE:
                return "DELETE";
        }
        return "GET";
    }

    const char* to_string(ResponseType type) {
        switch (type) {
            case ResponseType::JSON:
                return "json";
            case ResponseType::IMAGE:
                return "image";
            case ResponseType::DATA:
                return "data";
        }
        return "data";
    }

    const char* to_string(CachingLevel level) {
        switch (level) {
            case CachingLevel::NONE:
                return "none";
            case CachingLevel::MEMORY:
                return "memory";
            case CachingLevel::MEMORY_AND_FILE:
                return "memory_and_file";
        }
        return "none";
    }
}  // namespace tether::http::model
