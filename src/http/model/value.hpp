#ifndef TETHER_VALUE_HPP
#define TETHER_VALUE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "model.hpp"

namespace tether::http::model {
    class Value;

    using Sequence = std::vector<Value>;
    using Mapping = std::map<std::string, Value>;

    // Loosely-typed request parameters. Anything that does not fit one of these shapes cannot be encoded.
    class Value {
       public:
        using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Sequence, Mapping, FormDataPart>;

        Value() : storage_(nullptr) {}
        Value(std::nullptr_t) : storage_(nullptr) {}  // NOLINT(google-explicit-constructor)
        Value(bool b) : storage_(b) {}                // NOLINT(google-explicit-constructor)
        Value(int i) : storage_(static_cast<int64_t>(i)) {}  // NOLINT(google-explicit-constructor)
        Value(int64_t i) : storage_(i) {}                    // NOLINT(google-explicit-constructor)
        Value(double d) : storage_(d) {}                     // NOLINT(google-explicit-constructor)
        Value(const char* s) : storage_(std::string(s)) {}   // NOLINT(google-explicit-constructor)
        Value(std::string s) : storage_(std::move(s)) {}     // NOLINT(google-explicit-constructor)
        Value(Sequence s) : storage_(std::move(s)) {}        // NOLINT(google-explicit-constructor)
        Value(Mapping m) : storage_(std::move(m)) {}         // NOLINT(google-explicit-constructor)
        Value(FormDataPart p) : storage_(std::move(p)) {}    // NOLINT(google-explicit-constructor)

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
        [[nodiscard]] bool is_scalar() const;
        [[nodiscard]] bool is_sequence() const { return std::holds_alternative<Sequence>(storage_); }
        [[nodiscard]] bool is_mapping() const { return std::holds_alternative<Mapping>(storage_); }
        [[nodiscard]] bool is_part() const { return std::holds_alternative<FormDataPart>(storage_); }

        [[nodiscard]] const Sequence& as_sequence() const { return std::get<Sequence>(storage_); }
        [[nodiscard]] const Mapping& as_mapping() const { return std::get<Mapping>(storage_); }
        [[nodiscard]] const FormDataPart& as_part() const { return std::get<FormDataPart>(storage_); }
        [[nodiscard]] const Storage& storage() const { return storage_; }

        // Textual form of a scalar as used in query strings and form fields.
        [[nodiscard]] std::string scalar_text() const;

        bool operator==(const Value& other) const { return storage_ == other.storage_; }

       private:
        Storage storage_;
    };
}  // namespace tether::http::model

#endif
