// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <spdlog/spdlog.h>

#include "framestate/utility/json_store.hpp"

namespace framestate {
namespace utility {

    // Preference entries are stored as
    //   {"value": ..., "default_value": ..., "description": "..."}
    // at a json pointer path. preference_value reads the "value" field.
    template <typename T> T preference_value(const JsonStore &prefs, const std::string &path) {
        return prefs.get<T>(path + "/value");
    }

    // Missing entries fall back to "default_value", then to fallback.
    template <typename T>
    T preference_value(const JsonStore &prefs, const std::string &path, const T &fallback) {
        if (prefs.has(path + "/value"))
            return prefs.get<T>(path + "/value");
        if (prefs.has(path + "/default_value")) {
            spdlog::warn("Preference {} has no value, using its default", path);
            return prefs.get<T>(path + "/default_value");
        }
        spdlog::warn("Preference {} is missing, using the built in default", path);
        return fallback;
    }

    // Preference set with every entry used by the library at its default.
    JsonStore default_preferences();

    // Parse a preference file and overlay it on default_preferences().
    // Throws std::runtime_error if the file cannot be read or parsed.
    JsonStore load_preferences(const std::string &path);

} // namespace utility
} // namespace framestate
