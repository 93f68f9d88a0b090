/**
 * ordered_properties.cpp - Render an object schema's properties in order
 *
 * Demonstrates both serialization paths of xschema::SchemaProperties:
 * definition order, and x-order sorting for a container built from a map.
 */

#include <xschema/xschema.hpp>
#include <cstdio>
#include <string>

int main() {
    xschema::SerializeConfig config;
    config.indent = 2;
    config.verbose = true;

    // Definition order wins, x-order is carried through but not applied
    auto props = xschema::SchemaProperties::make();
    props.set("id", xschema::Schema::of_type("integer")
        .with_description("Primary key"));
    props.set("name", xschema::Schema::of_type("string")
        .with("minLength", 1)
        .with_order(2));
    props.set("price", xschema::Schema::of_type("number")
        .with_order(1));

    xschema::ordered_json product;
    product["type"] = "object";
    product["properties"] = props;
    printf("Definition order:\n%s\n", product.dump(2).c_str());

    // No insertion log: sorted by x-order, then by name
    xschema::SchemaProperties::map_type m;
    m["stock"] = xschema::Schema::of_type("integer");
    m["sku"] = xschema::Schema::of_type("string").with_order(1);
    m["color"] = xschema::Schema::of_type("string").with_order(2);
    m["brand"] = xschema::Schema::of_type("string");

    auto sorted = xschema::SchemaProperties::from_map(m);
    auto result = sorted.try_dump(config);
    if (!result.success) {
        fprintf(stderr, "Serialization error: %s\n", result.error.c_str());
        return 1;
    }
    printf("\nx-order:\n%s\n", result.json.c_str());

    // Uninitialized vs empty
    printf("\nUninitialized: %s\n", xschema::SchemaProperties().dump().c_str());
    printf("Empty: %s\n", xschema::SchemaProperties::make().dump().c_str());

    return 0;
}
