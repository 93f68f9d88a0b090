/**
 * xschema/error.hpp - Serialization error types
 *
 * Part of xschema - ordered JSON Schema property serialization.
 *
 * Two ways to learn about a failed encode:
 *   - SerializationError is thrown by dump() / from_json()
 *   - SerializeResult is returned by try_dump()
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace xschema {

// ============================================================================
// Exception
// ============================================================================

class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& msg)
        : std::runtime_error(msg) {}

    SerializationError(const std::string& msg, std::string property)
        : std::runtime_error(msg), property_(std::move(property)) {}

    /// Name of the property whose encoding failed, empty if not known.
    const std::string& property() const { return property_; }

private:
    std::string property_;
};

// ============================================================================
// Result (exception-free path)
// ============================================================================

struct SerializeResult {
    bool success = false;
    std::string json;
    std::string error;

    static SerializeResult ok(std::string text) {
        SerializeResult r;
        r.success = true;
        r.json = std::move(text);
        return r;
    }

    static SerializeResult fail(const std::string& msg) {
        SerializeResult r;
        r.success = false;
        r.error = msg;
        return r;
    }
};

} // namespace xschema
