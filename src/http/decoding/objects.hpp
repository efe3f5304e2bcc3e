#ifndef TETHER_OBJECTS_HPP
#define TETHER_OBJECTS_HPP

#include <simdjson.h>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "../model/model.hpp"

namespace tether::http::decoding {
    // Owns the raw text and the simdjson parser that backs root(), so the parsed tree lives as long as the document.
    class JsonDocument {
       public:
        explicit JsonDocument(std::string text);

        ~JsonDocument() = default;
        JsonDocument(const JsonDocument&) = delete;
        JsonDocument& operator=(const JsonDocument&) = delete;
        JsonDocument(JsonDocument&&) = delete;
        JsonDocument& operator=(JsonDocument&&) = delete;

        [[nodiscard]] simdjson::dom::element root() const { return root_; }
        [[nodiscard]] const std::string& text() const { return text_; }
        [[nodiscard]] std::string minified() const;

        bool operator==(const JsonDocument& other) const { return minified() == other.minified(); }

       private:
        std::string text_;
        std::unique_ptr<simdjson::dom::parser> parser_;
        simdjson::dom::element root_;
    };

    enum class ImageFormat {
        PNG,
        JPEG,
        GIF,
        BMP,
    };

    struct Image {
        ImageFormat format_ = ImageFormat::PNG;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        std::string bytes_;

        bool operator==(const Image& other) const = default;
    };

    using Data = std::string;

    using JsonPtr = std::shared_ptr<const JsonDocument>;
    using ImagePtr = std::shared_ptr<const Image>;
    using DataPtr = std::shared_ptr<const Data>;

    // A decoded response body; the alternative always matches the ResponseType it was decoded for.
    using Object = std::variant<JsonPtr, ImagePtr, DataPtr>;

    model::ResponseType response_type_of(const Object& object);
}  // namespace tether::http::decoding

#endif
