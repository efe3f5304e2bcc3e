#include "parameter_encoder.hpp"

#include <json/json.h>
#include <simdjson.h>

#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"
#include "../url/url.hpp"

namespace tether::http::encoding {
    namespace {
        struct ContentTypes {
            static constexpr const char* JSON = "application/json";
            static constexpr const char* MULTIPART_FORM_DATA = "multipart/form-data; boundary=";
        };

        constexpr const char* CRLF = "\r\n";

        [[noreturn]] void throw_encoding(const std::string& msg) { throw http_error::HttpError(http_error::ErrorKind::ENCODING, std::string{}, msg); }

        void append_form_pairs(const std::string& prefix, const model::Value& value, std::vector<std::string>& pairs) {
            if (value.is_part()) {
                throw_encoding("Binary parts cannot be form-url-encoded (field '" + prefix + "')");
            }

            if (value.is_mapping()) {
                for (const auto& [key, child] : value.as_mapping()) {
                    append_form_pairs(prefix + "[" + key + "]", child, pairs);
                }
                return;
            }

            if (value.is_sequence()) {
                for (const auto& child : value.as_sequence()) {
                    append_form_pairs(prefix + "[]", child, pairs);
                }
                return;
            }

            pairs.emplace_back(url::percent_encode(prefix) + "=" + url::percent_encode(value.scalar_text()));
        }

        void require_utf8(const std::string& s) {
            if (!simdjson::validate_utf8(s.data(), s.size())) {
                throw_encoding("JSON strings must be valid UTF-8");
            }
        }

        Json::Value to_json(const model::Value& value) {
            const auto& storage = value.storage();

            if (value.is_null()) {
                return Json::Value(Json::nullValue);
            }
            if (const auto* b = std::get_if<bool>(&storage)) {
                return Json::Value(*b);
            }
            if (const auto* i = std::get_if<int64_t>(&storage)) {
                return Json::Value(static_cast<Json::Int64>(*i));
            }
            if (const auto* d = std::get_if<double>(&storage)) {
                if (!std::isfinite(*d)) {
                    throw_encoding("JSON cannot represent NaN or infinite numbers");
                }
                return Json::Value(*d);
            }
            if (const auto* s = std::get_if<std::string>(&storage)) {
                require_utf8(*s);
                return Json::Value(*s);
            }
            if (value.is_sequence()) {
                Json::Value array(Json::arrayValue);
                for (const auto& child : value.as_sequence()) {
                    array.append(to_json(child));
                }
                return array;
            }
            if (value.is_mapping()) {
                Json::Value object(Json::objectValue);
                for (const auto& [key, child] : value.as_mapping()) {
                    require_utf8(key);
                    object[key] = to_json(child);
                }
                return object;
            }
            throw_encoding("Binary parts cannot be serialized as JSON");
        }

        // Multipart header parameters are quoted strings; a line break would end the header.
        std::string quoted_header_parameter(const std::string& field, const std::string& text) {
            std::string out;
            out.reserve(text.size());
            for (const char c : text) {
                if (c == '\r' || c == '\n' || c == '\0') {
                    throw_encoding("Multipart " + field + " must not contain line breaks");
                }
                if (c == '"' || c == '\\') {
                    out.push_back('\\');
                }
                out.push_back(c);
            }
            return out;
        }

        void require_single_line(const std::string& field, const std::string& text) {
            if (text.find_first_of(std::string("\r\n\0", 3)) != std::string::npos) {
                throw_encoding("Multipart " + field + " must not contain line breaks");
            }
        }

        void append_multipart_field(const std::string& boundary, const std::string& name, const std::string& text, std::string& out) {
            out += "--" + boundary + CRLF;
            out += "Content-Disposition: form-data; name=\"" + quoted_header_parameter("field name", name) + "\"" + CRLF + CRLF;
            out += text + CRLF;
        }

        void append_multipart_part(const std::string& boundary, const model::FormDataPart& part, std::string& out) {
            if (part.data_.empty()) {
                throw_encoding("Form data part '" + part.parameter_name_ + "' has no content");
            }
            if (part.parameter_name_.empty()) {
                throw_encoding("Form data part is missing its field name");
            }

            const std::string filename = part.filename_.empty() ? part.parameter_name_ : part.filename_;
            require_single_line("content type", part.content_type_);
            out += "--" + boundary + CRLF;
            out += "Content-Disposition: form-data; name=\"" + quoted_header_parameter("field name", part.parameter_name_) + "\"; filename=\"" +
                   quoted_header_parameter("filename", filename) + "\"" + CRLF;
            out += "Content-Type: " + part.content_type_ + CRLF + CRLF;
            out += part.data_ + CRLF;
        }

        EncodedPayload encode_multipart(const std::string& boundary, const std::optional<model::Value>& parameters, const std::vector<model::FormDataPart>& parts) {
            std::string body;

            if (parameters && !parameters->is_null()) {
                if (!parameters->is_mapping()) {
                    throw_encoding("Multipart parameters must be a mapping of field names to values");
                }
                for (const auto& [name, value] : parameters->as_mapping()) {
                    if (value.is_part()) {
                        model::FormDataPart part = value.as_part();
                        if (part.parameter_name_.empty()) {
                            part.parameter_name_ = name;
                        }
                        append_multipart_part(boundary, part, body);
                    } else if (value.is_scalar()) {
                        append_multipart_field(boundary, name, value.scalar_text(), body);
                    } else {
                        throw_encoding("Multipart field '" + name + "' must be a scalar or a binary part");
                    }
                }
            }

            for (const auto& part : parts) {
                append_multipart_part(boundary, part, body);
            }

            body += "--" + boundary + "--" + CRLF;

            return EncodedPayload{
                .query_ = {},
                .body_ = std::move(body),
                .content_type_ = std::string(ContentTypes::MULTIPART_FORM_DATA) + boundary,
            };
        }

        EncodedPayload encode_custom(const EncodeOptions& options, const std::optional<model::Value>& parameters) {
            EncodedPayload payload{.query_ = {}, .body_ = {}, .content_type_ = options.custom_content_type_};

            if (!parameters || parameters->is_null()) {
                return payload;
            }
            if (const auto* s = std::get_if<std::string>(&parameters->storage())) {
                payload.body_ = *s;
            } else if (parameters->is_part()) {
                payload.body_ = parameters->as_part().data_;
            } else {
                throw_encoding("Custom parameters must be a string or a binary part");
            }
            return payload;
        }
    }  // namespace

    std::string form_url_encode(const model::Value& parameters) {
        if (!parameters.is_mapping()) {
            throw_encoding("Form-url-encoded parameters must be a mapping");
        }

        std::vector<std::string> pairs;
        for (const auto& [key, value] : parameters.as_mapping()) {
            append_form_pairs(key, value, pairs);
        }

        std::string query;
        for (const auto& pair : pairs) {
            if (!query.empty()) {
                query.push_back('&');
            }
            query += pair;
        }
        return query;
    }

    std::string json_encode(const model::Value& parameters) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        writer["emitUTF8"] = true;
        return Json::writeString(writer, to_json(parameters));
    }

    std::string make_boundary() {
        static constexpr std::string_view ALPHABET = "0123456789abcdefghijklmnopqrstuvwxyz";
        thread_local std::minstd_rand rng{std::random_device{}()};
        std::uniform_int_distribution<size_t> pick(0, ALPHABET.size() - 1);

        std::string boundary(constants::MULTIPART_BOUNDARY_PREFIX);
        for (size_t i = 0; i < constants::BOUNDARY_RANDOM_LENGTH; ++i) {
            boundary.push_back(ALPHABET[pick(rng)]);
        }
        return boundary;
    }

    EncodedPayload encode(const EncodeOptions& options, const std::optional<model::Value>& parameters, const std::vector<model::FormDataPart>& parts) {
        switch (options.parameter_type_) {
            case model::ParameterType::NONE:
                return {};
            case model::ParameterType::FORM_URL_ENCODED:
                if (!parameters || parameters->is_null()) {
                    return {};
                }
                return EncodedPayload{.query_ = form_url_encode(*parameters), .body_ = {}, .content_type_ = {}};
            case model::ParameterType::JSON:
                if (!parameters) {
                    return {};
                }
                return EncodedPayload{.query_ = {}, .body_ = json_encode(*parameters), .content_type_ = ContentTypes::JSON};
            case model::ParameterType::MULTIPART_FORM_DATA:
                return encode_multipart(options.boundary_.empty() ? make_boundary() : options.boundary_, parameters, parts);
            case model::ParameterType::CUSTOM:
                return encode_custom(options, parameters);
        }
        return {};
    }
}  // namespace tether::http::encoding
