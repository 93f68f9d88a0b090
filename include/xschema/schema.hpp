/**
 * xschema/schema.hpp - Sub-schema value
 *
 * Part of xschema - ordered JSON Schema property serialization.
 *
 * A Schema is one JSON Schema node: its regular keywords kept in
 * definition order, plus its vendor extensions. The encoded form lists
 * the keywords first, then the extensions in key order. Keys starting
 * with "x-" are always extensions and never keywords, so the two never
 * collide.
 *
 * Example:
 *
 *   auto id = xschema::Schema::of_type("integer")
 *       .with_description("Primary key")
 *       .with_order(1);
 */

#pragma once

#include "error.hpp"
#include "extensions.hpp"
#include "json.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace xschema {

class Schema {
public:
    Schema() : body_(ordered_json::object()) {}

    static Schema of_type(const std::string& type) {
        return Schema().with("type", type);
    }

    // ========================================================================
    // Builders
    // ========================================================================

    /// Sets a regular keyword. Keys starting with "x-" go to extensions.
    Schema& with(const std::string& key, ordered_json value) & {
        if (is_extension_key(key)) {
            extensions_.add(key, std::move(value));
        } else {
            body_[key] = std::move(value);
        }
        return *this;
    }

    Schema&& with(const std::string& key, ordered_json value) && {
        return std::move(with(key, std::move(value)));
    }

    /// Same routing as with(): a key without the "x-" prefix is a keyword.
    Schema& with_extension(const std::string& key, ordered_json value) & {
        return with(key, std::move(value));
    }

    Schema&& with_extension(const std::string& key, ordered_json value) && {
        return std::move(with_extension(key, std::move(value)));
    }

    Schema& with_order(ordered_json value) & {
        return with_extension(kOrderExtension, std::move(value));
    }

    Schema&& with_order(ordered_json value) && {
        return std::move(with_order(std::move(value)));
    }

    Schema& with_description(const std::string& text) & {
        return with("description", text);
    }

    Schema&& with_description(const std::string& text) && {
        return std::move(with_description(text));
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    const ordered_json& body() const { return body_; }
    const Extensions& extensions() const { return extensions_; }
    Extensions& extensions() { return extensions_; }

    std::string type() const {
        auto it = body_.find("type");
        if (it == body_.end() || !it->is_string()) return "";
        return it->get<std::string>();
    }

    std::optional<OrderKey> order() const { return order_key(extensions_); }

    bool operator==(const Schema& other) const {
        return body_ == other.body_ && extensions_ == other.extensions_;
    }
    bool operator!=(const Schema& other) const { return !(*this == other); }

    // ========================================================================
    // JSON
    // ========================================================================

    ordered_json to_json() const {
        ordered_json j = body_;
        for (const auto& [key, value] : extensions_) {
            j[key] = value;
        }
        return j;
    }

    /// Splits an already parsed object into keywords and extensions.
    static Schema from_json(const ordered_json& j) {
        if (!j.is_object()) {
            throw SerializationError(std::string("schema must be a JSON object, got ") + j.type_name());
        }
        Schema s;
        for (const auto& item : j.items()) {
            s.with(item.key(), item.value());
        }
        return s;
    }

private:
    ordered_json body_;
    Extensions extensions_;
};

inline std::ostream& operator<<(std::ostream& os, const Schema& s) {
    return os << s.to_json().dump();
}

inline void to_json(ordered_json& j, const Schema& s) {
    j = s.to_json();
}

inline void from_json(const ordered_json& j, Schema& s) {
    s = Schema::from_json(j);
}

} // namespace xschema
