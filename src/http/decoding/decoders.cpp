#include "decoders.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace tether::http::decoding {
    namespace {
        struct PngLayout {
            static constexpr std::array<unsigned char, 8> SIGNATURE = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
            static constexpr size_t CHUNK_TYPE_OFFSET = 12;
            static constexpr size_t WIDTH_OFFSET = 16;
            static constexpr size_t HEIGHT_OFFSET = 20;
            static constexpr size_t MIN_SIZE = 24;
        };

        struct GifLayout {
            static constexpr const char* SIGNATURE_87A = "GIF87a";
            static constexpr const char* SIGNATURE_89A = "GIF89a";
            static constexpr size_t WIDTH_OFFSET = 6;
            static constexpr size_t HEIGHT_OFFSET = 8;
            static constexpr size_t MIN_SIZE = 10;
        };

        struct BmpLayout {
            static constexpr size_t WIDTH_OFFSET = 18;
            static constexpr size_t HEIGHT_OFFSET = 22;
            static constexpr size_t MIN_SIZE = 26;
        };

        struct JpegMarkers {
            static constexpr unsigned char PREFIX = 0xFF;
            static constexpr unsigned char SOI = 0xD8;
            static constexpr unsigned char SOS = 0xDA;
            static constexpr unsigned char EOI = 0xD9;
            static constexpr unsigned char TEM = 0x01;
            static constexpr unsigned char RST0 = 0xD0;
            static constexpr unsigned char RST7 = 0xD7;
            static constexpr unsigned char SOF0 = 0xC0;
            static constexpr unsigned char SOF15 = 0xCF;
            static constexpr unsigned char DHT = 0xC4;
            static constexpr unsigned char JPG = 0xC8;
            static constexpr unsigned char DAC = 0xCC;
            static constexpr size_t SOF_HEIGHT_OFFSET = 5;
            static constexpr size_t SOF_WIDTH_OFFSET = 7;
        };

        uint8_t byte_at(std::string_view b, size_t i) { return static_cast<uint8_t>(b[i]); }

        uint32_t read_be16(std::string_view b, size_t i) { return (uint32_t{byte_at(b, i)} << 8U) | byte_at(b, i + 1); }

        uint32_t read_be32(std::string_view b, size_t i) { return (read_be16(b, i) << 16U) | read_be16(b, i + 2); }

        uint32_t read_le16(std::string_view b, size_t i) { return uint32_t{byte_at(b, i)} | (uint32_t{byte_at(b, i + 1)} << 8U); }

        int32_t read_le32(std::string_view b, size_t i) { return static_cast<int32_t>(read_le16(b, i) | (read_le16(b, i + 2) << 16U)); }

        [[noreturn]] void throw_decoding(std::string_view body, const std::string& msg) {
            throw http_error::HttpError(http_error::ErrorKind::DECODING, 0, std::string{}, std::string(body.substr(0, constants::ERROR_MESSAGE_LENGTH)), msg);
        }

        bool is_png(std::string_view b) {
            if (b.size() < PngLayout::SIGNATURE.size()) {
                return false;
            }
            for (size_t i = 0; i < PngLayout::SIGNATURE.size(); ++i) {
                if (byte_at(b, i) != PngLayout::SIGNATURE[i]) {
                    return false;
                }
            }
            return true;
        }

        bool is_gif(std::string_view b) { return b.starts_with(GifLayout::SIGNATURE_87A) || b.starts_with(GifLayout::SIGNATURE_89A); }

        bool is_bmp(std::string_view b) { return b.starts_with("BM"); }

        bool is_jpeg(std::string_view b) { return b.size() >= 2 && byte_at(b, 0) == JpegMarkers::PREFIX && byte_at(b, 1) == JpegMarkers::SOI; }

        bool is_start_of_frame(unsigned char marker) {
            return marker >= JpegMarkers::SOF0 && marker <= JpegMarkers::SOF15 && marker != JpegMarkers::DHT && marker != JpegMarkers::JPG &&
                   marker != JpegMarkers::DAC;
        }

        void read_png(std::string_view b, Image& image) {
            if (b.size() < PngLayout::MIN_SIZE || b.substr(PngLayout::CHUNK_TYPE_OFFSET, 4) != "IHDR") {
                throw_decoding(b, "PNG header is truncated or missing IHDR");
            }
            image.format_ = ImageFormat::PNG;
            image.width_ = read_be32(b, PngLayout::WIDTH_OFFSET);
            image.height_ = read_be32(b, PngLayout::HEIGHT_OFFSET);
        }

        void read_gif(std::string_view b, Image& image) {
            if (b.size() < GifLayout::MIN_SIZE) {
                throw_decoding(b, "GIF header is truncated");
            }
            image.format_ = ImageFormat::GIF;
            image.width_ = read_le16(b, GifLayout::WIDTH_OFFSET);
            image.height_ = read_le16(b, GifLayout::HEIGHT_OFFSET);
        }

        void read_bmp(std::string_view b, Image& image) {
            if (b.size() < BmpLayout::MIN_SIZE) {
                throw_decoding(b, "BMP header is truncated");
            }
            image.format_ = ImageFormat::BMP;
            const int32_t width = read_le32(b, BmpLayout::WIDTH_OFFSET);
            // negative height marks a top-down bitmap
            const int32_t height = read_le32(b, BmpLayout::HEIGHT_OFFSET);
            if (width == std::numeric_limits<int32_t>::min() || height == std::numeric_limits<int32_t>::min()) {
                throw_decoding(b, "BMP dimensions are out of range");
            }

            image.width_ = static_cast<uint32_t>(std::abs(width));
            image.height_ = static_cast<uint32_t>(std::abs(height));
        }

        void read_jpeg(std::string_view b, Image& image) {
            size_t pos = 2;

            while (pos + 1 < b.size()) {
                if (byte_at(b, pos) != JpegMarkers::PREFIX) {
                    throw_decoding(b, "JPEG segment does not start with a marker");
                }
                while (pos + 1 < b.size() && byte_at(b, pos + 1) == JpegMarkers::PREFIX) {
                    ++pos;
                }
                if (pos + 1 >= b.size()) {
                    break;
                }

                const unsigned char marker = byte_at(b, pos + 1);
                if (marker == JpegMarkers::SOI || marker == JpegMarkers::TEM || (marker >= JpegMarkers::RST0 && marker <= JpegMarkers::RST7)) {
                    pos += 2;
                    continue;
                }
                if (marker == JpegMarkers::SOS || marker == JpegMarkers::EOI) {
                    break;
                }
                if (pos + 4 > b.size()) {
                    break;
                }

                const uint32_t segment_length = read_be16(b, pos + 2);
                if (is_start_of_frame(marker)) {
                    if (pos + JpegMarkers::SOF_WIDTH_OFFSET + 2 > b.size()) {
                        break;
                    }
                    image.format_ = ImageFormat::JPEG;
                    image.height_ = read_be16(b, pos + JpegMarkers::SOF_HEIGHT_OFFSET);
                    image.width_ = read_be16(b, pos + JpegMarkers::SOF_WIDTH_OFFSET);
                    return;
                }
                pos += 2 + segment_length;
            }

            throw_decoding(b, "JPEG stream has no frame header");
        }
    }  // namespace

    JsonPtr decode_json(std::string body) { return std::make_shared<const JsonDocument>(std::move(body)); }

    ImagePtr decode_image(std::string body) {
        auto image = std::make_shared<Image>();
        const std::string_view b(body);

        if (is_png(b)) {
            read_png(b, *image);
        } else if (is_jpeg(b)) {
            read_jpeg(b, *image);
        } else if (is_gif(b)) {
            read_gif(b, *image);
        } else if (is_bmp(b)) {
            read_bmp(b, *image);
        } else {
            throw_decoding(b, "Response body is not a supported image format");
        }

        if (image->width_ == 0 || image->height_ == 0) {
            throw_decoding(b, "Image has zero width or height");
        }

        image->bytes_ = std::move(body);
        return image;
    }

    DataPtr decode_data(std::string body) { return std::make_shared<const Data>(std::move(body)); }

    Object decode(model::ResponseType type, std::string body) {
        switch (type) {
            case model::ResponseType::JSON:
                return decode_json(std::move(body));
            case model::ResponseType::IMAGE:
                return decode_image(std::move(body));
            case model::ResponseType::DATA:
                return decode_data(std::move(body));
        }
        return decode_data(std::move(body));
    }

    std::string encode_for_disk(const Object& object) {
        if (const auto* json = std::get_if<JsonPtr>(&object)) {
            return (*json)->text();
        }
        if (const auto* image = std::get_if<ImagePtr>(&object)) {
            return (*image)->bytes_;
        }
        return *std::get<DataPtr>(object);
    }
}  // namespace tether::http::decoding
