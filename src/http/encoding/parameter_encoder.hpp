#ifndef TETHER_PARAMETER_ENCODER_HPP
#define TETHER_PARAMETER_ENCODER_HPP

#include <optional>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "../model/value.hpp"

namespace tether::http::encoding {
    struct EncodedPayload {
        std::string query_;
        std::string body_;
        std::string content_type_;
    };

    struct EncodeOptions {
        model::ParameterType parameter_type_ = model::ParameterType::NONE;
        // Only read for ParameterType::CUSTOM.
        std::string custom_content_type_;
        // Empty means a random boundary is generated.
        std::string boundary_;
    };

    // Turns parameters (and multipart parts) into a query string or a request body.
    // Throws HttpError(ENCODING) for any parameter shape the chosen encoding cannot represent.
    EncodedPayload encode(const EncodeOptions& options, const std::optional<model::Value>& parameters, const std::vector<model::FormDataPart>& parts = {});

    std::string form_url_encode(const model::Value& parameters);

    std::string json_encode(const model::Value& parameters);

    std::string make_boundary();
}  // namespace tether::http::encoding

#endif
