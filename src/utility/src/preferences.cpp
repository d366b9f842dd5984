// SPDX-License-Identifier: Apache-2.0

#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "framestate/utility/preferences.hpp"

using namespace framestate::utility;

namespace {

nlohmann::json make_pref(const nlohmann::json &default_value, const std::string &description) {
    return nlohmann::json{
        {"value", default_value},
        {"default_value", default_value},
        {"description", description}};
}

} // anonymous namespace

JsonStore framestate::utility::default_preferences() {

    JsonStore prefs;
    prefs.set(
        make_pref("info", "Minimum level of log messages (trace, debug, info, warn, error, critical, off)."),
        "/framestate/log/level");
    prefs.set(make_pref("", "Optional path of a log file, in addition to stdout."), "/framestate/log/file");
    prefs.set(
        make_pref(
            true,
            "Verify the record invariants before committing each reassignment and count "
            "candidates on every active record query."),
        "/framestate/engine/verify_invariants");
    return prefs;
}

JsonStore framestate::utility::load_preferences(const std::string &path) {

    std::ifstream i(path);
    if (!i.is_open())
        throw std::runtime_error(fmt::format("Unable to open preference file {}", path));

    nlohmann::json j;
    try {
        i >> j;
    } catch (const nlohmann::json::exception &e) {
        throw std::runtime_error(
            fmt::format("Failed to parse preference file {}: {}", path, e.what()));
    }

    JsonStore prefs = default_preferences();
    prefs.merge_patch(j);
    spdlog::debug("Loaded preferences from {}", path);
    return prefs;
}
