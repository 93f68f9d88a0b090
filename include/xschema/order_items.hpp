/**
 * xschema/order_items.hpp - Sortable, serializable (name, schema) sequence
 *
 * Part of xschema - ordered JSON Schema property serialization.
 *
 * OrderSchemaItems renders as a JSON object whose members appear in
 * exactly the sequence order. sort() orders the sequence by the x-order
 * extension:
 *
 *   - both have x-order: integers numerically; integer/string mixes and
 *     strings by their text; any other value type by name
 *   - only one has x-order: that one first
 *   - neither: by name
 *
 * Example:
 *
 *   xschema::OrderSchemaItems items;
 *   items.push_back({"b", xschema::Schema::of_type("string")});
 *   items.push_back({"a", xschema::Schema::of_type("string").with_order(1)});
 *   items.sort();
 *   items.dump();   // {"a":{...},"b":{...}}
 */

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "json.hpp"
#include "schema.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xschema {

// ============================================================================
// Tie-break policy
// ============================================================================

/// Strict "a before b" for two entries given their x-order values.
inline bool order_less(const std::optional<OrderKey>& ka, const std::string& name_a,
                       const std::optional<OrderKey>& kb, const std::string& name_b) {
    if (ka && kb) {
        if (ka->kind == OrderKind::Integer && kb->kind == OrderKind::Integer) {
            return ka->integer < kb->integer;
        }
        if (ka->kind != OrderKind::Other && kb->kind != OrderKind::Other) {
            return ka->text() < kb->text();
        }
        // TODO: drop this tier once Other values are rejected when schemas are built
        return name_a < name_b;
    }
    if (ka) return true;
    if (kb) return false;
    return name_a < name_b;
}

// ============================================================================
// Items
// ============================================================================

struct OrderSchemaItem {
    std::string name;
    Schema schema;
};

inline bool order_less(const OrderSchemaItem& a, const OrderSchemaItem& b) {
    return order_less(a.schema.order(), a.name, b.schema.order(), b.name);
}

class OrderSchemaItems {
public:
    using container_type = std::vector<OrderSchemaItem>;

    OrderSchemaItems() = default;
    explicit OrderSchemaItems(container_type items) : items_(std::move(items)) {}

    void reserve(size_t n) { items_.reserve(n); }
    void push_back(OrderSchemaItem item) { items_.push_back(std::move(item)); }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const OrderSchemaItem& operator[](size_t i) const { return items_[i]; }
    OrderSchemaItem& operator[](size_t i) { return items_[i]; }

    auto begin() { return items_.begin(); }
    auto end() { return items_.end(); }
    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(items_.size());
        for (const auto& item : items_) out.push_back(item.name);
        return out;
    }

    /**
     * Sort by the tie-break policy.
     * Entries are put in name order first, then stable-sorted, so equal
     * x-order values keep name order whatever order they arrived in.
     */
    void sort() {
        struct Entry {
            std::optional<OrderKey> key;
            OrderSchemaItem item;
        };

        std::vector<Entry> entries;
        entries.reserve(items_.size());
        for (auto& item : items_) {
            auto key = item.schema.order();
            entries.push_back({std::move(key), std::move(item)});
        }

        std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return a.item.name < b.item.name;
        });
        std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return order_less(a.key, a.item.name, b.key, b.item.name);
        });

        items_.clear();
        for (auto& e : entries) items_.push_back(std::move(e.item));
    }

    // ========================================================================
    // JSON
    // ========================================================================

    /// Object with one member per item, in sequence order.
    ordered_json to_json() const {
        ordered_json j = ordered_json::object();
        for (const auto& item : items_) {
            j[item.name] = item.schema.to_json();
        }
        return j;
    }

    /**
     * Encode as JSON object text.
     * @throws SerializationError if a name or schema cannot be encoded
     *         (invalid UTF-8). Nothing is returned in that case.
     */
    std::string dump(const SerializeConfig& config = SerializeConfig()) const {
        ordered_json j = to_json();
        try {
            return j.dump(config.indent, config.indent_char, config.ensure_ascii);
        } catch (const ordered_json::exception& e) {
            std::string property = failing_property(config);
            std::string msg = property.empty()
                ? std::string("failed to encode properties: ") + e.what()
                : "failed to encode property '" + property + "': " + e.what();
            config.log(msg);
            throw SerializationError(msg, property);
        }
    }

    SerializeResult try_dump(const SerializeConfig& config = SerializeConfig()) const {
        try {
            return SerializeResult::ok(dump(config));
        } catch (const SerializationError& e) {
            return SerializeResult::fail(e.what());
        }
    }

private:
    // Encodes members one by one to name the first one that fails.
    std::string failing_property(const SerializeConfig& config) const {
        for (const auto& item : items_) {
            try {
                ordered_json(item.name).dump(-1, ' ', config.ensure_ascii);
                item.schema.to_json().dump(-1, ' ', config.ensure_ascii);
            } catch (const ordered_json::exception&) {
                return item.name;
            }
        }
        return "";
    }

    container_type items_;
};

inline void to_json(ordered_json& j, const OrderSchemaItems& items) {
    j = items.to_json();
}

} // namespace xschema
