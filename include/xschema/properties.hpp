/**
 * xschema/properties.hpp - Ordered `properties` container of an object schema
 *
 * Part of xschema - ordered JSON Schema property serialization.
 *
 * SchemaProperties keeps a name -> Schema lookup map next to a log of
 * names in insertion order. Serialization uses the insertion log when the
 * container has one; a container built from a plain map has none and is
 * sorted by x-order instead (see order_items.hpp).
 *
 * An uninitialized container serializes as null, an initialized empty
 * one as {}.
 *
 * Example:
 *
 *   auto props = xschema::SchemaProperties::make();
 *   props.set("id", xschema::Schema::of_type("integer"));
 *   props.set("name", xschema::Schema::of_type("string"));
 *
 *   std::string text = props.dump();
 *   // {"id":{"type":"integer"},"name":{"type":"string"}}
 */

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "json.hpp"
#include "order_items.hpp"
#include "schema.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xschema {

class SchemaProperties {
public:
    using map_type = std::unordered_map<std::string, Schema>;

    /// Uninitialized: size() is 0 and dump() gives "null".
    SchemaProperties() = default;

    /// Empty container that records insertion order.
    static SchemaProperties make() {
        SchemaProperties p;
        p.origin_.emplace();
        p.sequence_.emplace();
        return p;
    }

    /// Container without insertion order; serialized in x-order/name order.
    static SchemaProperties from_map(map_type origin) {
        SchemaProperties p;
        p.origin_ = std::move(origin);
        return p;
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Insert or overwrite a property.
     * A name that is already present keeps its position.
     */
    void set(const std::string& name, Schema schema) {
        if (!origin_) {
            origin_.emplace();
            sequence_.emplace();
        }
        bool inserted = origin_->insert_or_assign(name, std::move(schema)).second;
        if (inserted && sequence_) {
            sequence_->push_back(name);
        }
    }

    // ========================================================================
    // Access
    // ========================================================================

    size_t size() const { return origin_ ? origin_->size() : 0; }
    bool empty() const { return size() == 0; }

    bool initialized() const { return origin_.has_value(); }
    bool has_sequence() const { return sequence_.has_value(); }

    const Schema* find(const std::string& name) const {
        if (!origin_) return nullptr;
        auto it = origin_->find(name);
        return it == origin_->end() ? nullptr : &it->second;
    }

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /**
     * Project into a (name, schema) sequence.
     * Insertion order when recorded, otherwise sorted by the x-order
     * tie-break policy.
     */
    OrderSchemaItems to_ordered_items(const SerializeConfig& config = SerializeConfig()) const {
        OrderSchemaItems items;
        if (!origin_) return items;

        items.reserve(origin_->size());
        if (sequence_) {
            for (const auto& name : *sequence_) {
                items.push_back({name, origin_->at(name)});
            }
            return items;
        }

        for (const auto& [name, schema] : *origin_) {
            items.push_back({name, schema});
        }
        config.log("no insertion order recorded, sorting " +
                   std::to_string(items.size()) + " properties by " + kOrderExtension);
        items.sort();
        return items;
    }

    // ========================================================================
    // JSON
    // ========================================================================

    /**
     * JSON value for embedding into a larger document.
     * Nothing is encoded here: invalid UTF-8 surfaces later as a raw
     * nlohmann type_error from the caller's dump(). Use to_json_checked()
     * to get a SerializationError up front instead.
     */
    ordered_json to_json() const {
        if (!origin_) return nullptr;
        return to_ordered_items().to_json();
    }

    /**
     * to_json() after a trial encode with the given config.
     * @throws SerializationError (logged) if a property cannot be encoded
     */
    ordered_json to_json_checked(const SerializeConfig& config = SerializeConfig()) const {
        if (!origin_) return nullptr;
        OrderSchemaItems items = to_ordered_items(config);
        items.dump(config);
        return items.to_json();
    }

    /**
     * Encode as JSON text: "null" when uninitialized, else an object.
     * @throws SerializationError if a property cannot be encoded
     */
    std::string dump(const SerializeConfig& config = SerializeConfig()) const {
        if (!origin_) return "null";
        return to_ordered_items(config).dump(config);
    }

    SerializeResult try_dump(const SerializeConfig& config = SerializeConfig()) const {
        try {
            return SerializeResult::ok(dump(config));
        } catch (const SerializationError& e) {
            return SerializeResult::fail(e.what());
        }
    }

    /// null -> uninitialized; object -> insertion-ordered in member order.
    static SchemaProperties from_json(const ordered_json& j) {
        if (j.is_null()) return SchemaProperties();
        if (!j.is_object()) {
            throw SerializationError(std::string("properties must be a JSON object or null, got ") + j.type_name());
        }
        SchemaProperties p = make();
        for (const auto& item : j.items()) {
            try {
                p.set(item.key(), Schema::from_json(item.value()));
            } catch (const SerializationError& e) {
                throw SerializationError("property '" + item.key() + "': " + e.what(), item.key());
            }
        }
        return p;
    }

private:
    std::optional<map_type> origin_;
    std::optional<std::vector<std::string>> sequence_;
};

/// Unchecked, see SchemaProperties::to_json().
inline void to_json(ordered_json& j, const SchemaProperties& p) {
    j = p.to_json();
}

inline void from_json(const ordered_json& j, SchemaProperties& p) {
    p = SchemaProperties::from_json(j);
}

} // namespace xschema
