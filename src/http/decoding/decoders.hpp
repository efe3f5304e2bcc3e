#ifndef TETHER_DECODERS_HPP
#define TETHER_DECODERS_HPP

#include <string>
#include <string_view>

#include "../model/model.hpp"
#include "objects.hpp"

namespace tether::http::decoding {
    // All decoders throw HttpError(DECODING) when the bytes do not match the requested type.
    JsonPtr decode_json(std::string body);
    ImagePtr decode_image(std::string body);
    DataPtr decode_data(std::string body);

    Object decode(model::ResponseType type, std::string body);

    // Bytes that decode(response_type_of(object), ...) turns back into an equal object.
    std::string encode_for_disk(const Object& object);
}  // namespace tether::http::decoding

#endif
