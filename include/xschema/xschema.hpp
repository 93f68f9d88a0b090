/**
 * xschema/xschema.hpp - Master include for xschema
 *
 * xschema - ordered JSON Schema property serialization
 *
 * Include this single header to get all xschema functionality:
 *   - Schema, Extensions - sub-schema value and its vendor extensions
 *   - SchemaProperties - `properties` map that remembers definition order
 *   - OrderSchemaItems - x-order sorting and ordered JSON rendering
 *
 * Example (definition order):
 *
 *   #include <xschema/xschema.hpp>
 *
 *   auto props = xschema::SchemaProperties::make();
 *   props.set("zeta", xschema::Schema::of_type("string"));
 *   props.set("alpha", xschema::Schema::of_type("integer"));
 *   props.dump();   // {"zeta":{...},"alpha":{...}}
 *
 * Example (x-order):
 *
 *   xschema::SchemaProperties::map_type m;
 *   m["b"] = xschema::Schema::of_type("string");
 *   m["a"] = xschema::Schema::of_type("string").with_order(2);
 *   m["c"] = xschema::Schema::of_type("string").with_order(1);
 *   xschema::SchemaProperties::from_map(m).dump();   // c, a, b
 */

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "extensions.hpp"
#include "json.hpp"
#include "order_items.hpp"
#include "properties.hpp"
#include "schema.hpp"
