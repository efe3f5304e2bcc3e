#include "value.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace tether::http::model {
    bool Value::is_scalar() const {
        return std::holds_alternative<std::nullptr_t>(storage_) || std::holds_alternative<bool>(storage_) || std::holds_alternative<int64_t>(storage_) ||
               std::holds_alternative<double>(storage_) || std::holds_alternative<std::string>(storage_);
    }

    std::string Value::scalar_text() const {
        if (std::holds_alternative<std::nullptr_t>(storage_)) {
            return {};
        }
        if (const auto* b = std::get_if<bool>(&storage_)) {
            return *b ? "true" : "false";
        }
        if (const auto* i = std::get_if<int64_t>(&storage_)) {
            return std::to_string(*i);
        }
        if (const auto* d = std::get_if<double>(&storage_)) {
            std::ostringstream oss;
            oss.precision(17);
            oss << *d;
            return oss.str();
        }
        if (const auto* s = std::get_if<std::string>(&storage_)) {
            return *s;
        }
        throw std::logic_error("scalar_text called on a non-scalar value");
    }
}  // namespace tether::http::model
