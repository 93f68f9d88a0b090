#pragma once
/// @file json.hpp
/// @brief JSON library alias for xschema
///
/// Every schema body, extension value and rendered `properties` object in
/// xschema goes through these aliases. Currently wraps nlohmann/json.
/// ordered_json is the working type: member order is part of the output.

#include <nlohmann/json.hpp>

namespace xschema {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

} // namespace xschema
