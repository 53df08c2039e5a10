/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading payroll configuration (settings.json).
 *
 * Keeps JSON parsing of the tunable constants in one place; the domain only
 * ever sees a PayrollSettings value.
 */

#pragma once

#include <string>

#include "domain/PayrollSettings.hpp"

namespace paytrack::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json on top of the built-in defaults.
     * @param path Path of the settings file.
     * @return Defaults overridden by every key present in the file. A missing
     *         file yields the defaults; a malformed one is reported on stderr
     *         and also yields the defaults.
     */
    static domain::PayrollSettings LoadSettings(const std::string& path);

    /** @brief Same, from a JSON document already in memory. */
    static domain::PayrollSettings ParseSettings(const std::string& jsonText);
};

} // namespace paytrack::infrastructure
