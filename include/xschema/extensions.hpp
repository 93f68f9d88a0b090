/**
 * xschema/extensions.hpp - Vendor extension map and x-order lookup
 *
 * Part of xschema - ordered JSON Schema property serialization.
 *
 * Extension keys are case-insensitive and stored lower-cased, so
 * "X-Order" and "x-order" address the same entry.
 *
 * Example:
 *
 *   xschema::Extensions ext;
 *   ext.add("x-order", 3);
 *
 *   if (auto key = xschema::order_key(ext)) {
 *       if (key->kind == xschema::OrderKind::Integer) ...
 *   }
 */

#pragma once

#include "json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace xschema {

/// Extension that carries an explicit property position.
inline constexpr const char* kOrderExtension = "x-order";

inline std::string lower_key(std::string key) {
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return key;
}

/// True for keys of the form "x-..." in any case.
inline bool is_extension_key(const std::string& key) {
    return key.size() >= 2 && (key[0] == 'x' || key[0] == 'X') && key[1] == '-';
}

// ============================================================================
// Extensions
// ============================================================================

class Extensions {
public:
    using map_type = std::map<std::string, ordered_json>;
    using const_iterator = map_type::const_iterator;

    Extensions() = default;

    /// Returns false (and stores nothing) unless key is of the form "x-...".
    bool add(const std::string& key, ordered_json value) {
        if (!is_extension_key(key)) return false;
        values_[lower_key(key)] = std::move(value);
        return true;
    }

    bool remove(const std::string& key) {
        return values_.erase(lower_key(key)) > 0;
    }

    const ordered_json* find(const std::string& key) const {
        auto it = values_.find(lower_key(key));
        return it == values_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    bool get_string(const std::string& key, std::string& out) const {
        const ordered_json* v = find(key);
        if (!v || !v->is_string()) return false;
        out = v->get<std::string>();
        return true;
    }

    bool get_bool(const std::string& key, bool& out) const {
        const ordered_json* v = find(key);
        if (!v || !v->is_boolean()) return false;
        out = v->get<bool>();
        return true;
    }

    bool get_int(const std::string& key, int64_t& out) const {
        const ordered_json* v = find(key);
        if (!v) return false;
        if (v->is_number_unsigned()) {
            auto u = v->get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
            out = static_cast<int64_t>(u);
            return true;
        }
        if (!v->is_number_integer()) return false;
        out = v->get<int64_t>();
        return true;
    }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    void clear() { values_.clear(); }

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    bool operator==(const Extensions& other) const { return values_ == other.values_; }
    bool operator!=(const Extensions& other) const { return !(*this == other); }

private:
    map_type values_;
};

// ============================================================================
// Ordering key
// ============================================================================

enum class OrderKind {
    Integer,
    String,
    Other   // boolean, float, null, array, object, out-of-range unsigned
};

struct OrderKey {
    OrderKind kind = OrderKind::Other;
    int64_t integer = 0;
    std::string string;

    /// Text used by the string tier: decimal for integers.
    std::string text() const {
        return kind == OrderKind::Integer ? std::to_string(integer) : string;
    }

    static OrderKey from_json(const ordered_json& v) {
        OrderKey key;
        if (v.is_string()) {
            key.kind = OrderKind::String;
            key.string = v.get<std::string>();
        } else if (v.is_number_unsigned()) {
            auto u = v.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                key.kind = OrderKind::Integer;
                key.integer = static_cast<int64_t>(u);
            }
        } else if (v.is_number_integer()) {
            key.kind = OrderKind::Integer;
            key.integer = v.get<int64_t>();
        }
        return key;
    }
};

/// Reads x-order. Empty when the extension is absent.
inline std::optional<OrderKey> order_key(const Extensions& ext) {
    const ordered_json* v = ext.find(kOrderExtension);
    if (!v) return std::nullopt;
    return OrderKey::from_json(*v);
}

} // namespace xschema
