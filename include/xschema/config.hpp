/**
 * @file config.hpp
 * @brief Rendering configuration and log sink for xschema
 *
 * Usage:
 *   xschema::SerializeConfig config;
 *   config.indent = 2;
 *   config.set_log_func([](const std::string& msg) { my_log(msg); });
 *   std::string text = props.dump(config);
 */

#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace xschema {

//=============================================================================
// Serialize Configuration
//=============================================================================

struct SerializeConfig {
    using log_func_t = std::function<void(const std::string& msg)>;

    int indent = -1;            // < 0: compact output
    char indent_char = ' ';
    bool ensure_ascii = false;  // escape non-ASCII as \uXXXX
    bool verbose = false;
    log_func_t log_func;

    void set_log_func(log_func_t func) { log_func = std::move(func); }

    void log(const std::string& msg) const {
        if (log_func) {
            log_func(msg);
        } else if (verbose) {
            std::cerr << "[xschema] " << msg << std::endl;
        }
    }
};

} // namespace xschema
