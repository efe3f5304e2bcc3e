#include "objects.hpp"

#include <simdjson.h>

#include <memory>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace tether::http::decoding {
    namespace {
        constexpr const char* EMPTY_JSON = "null";
    }

    JsonDocument::JsonDocument(std::string text) : text_(std::move(text)), parser_(std::make_unique<simdjson::dom::parser>()) {
        const std::string_view source = text_.empty() ? std::string_view(EMPTY_JSON) : std::string_view(text_);
        const auto error = parser_->parse(source.data(), source.size()).get(root_);

        if (error != simdjson::SUCCESS) {
            throw http_error::HttpError(http_error::ErrorKind::DECODING, 0, std::string{}, text_.substr(0, constants::ERROR_MESSAGE_LENGTH),
                                        "Failed to parse JSON response: " + std::string(simdjson::error_message(error)));
        }
    }

    std::string JsonDocument::minified() const { return simdjson::minify(root_); }

    model::ResponseType response_type_of(const Object& object) {
        if (std::holds_alternative<JsonPtr>(object)) {
            return model::ResponseType::JSON;
        }
        if (std::holds_alternative<ImagePtr>(object)) {
            return model::ResponseType::IMAGE;
        }
        return model::ResponseType::DATA;
    }
}  // namespace tether::http::decoding
