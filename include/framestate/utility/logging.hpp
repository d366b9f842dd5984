// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <spdlog/spdlog.h>

#include "framestate/utility/json_store.hpp"

namespace framestate {
namespace utility {

    struct LoggerOptions {
        spdlog::level::level_enum level{spdlog::level::info};
        std::string logfile;

        static LoggerOptions from_preferences(const JsonStore &prefs);
    };

    // unknown names map to spdlog::level::info with a warning
    spdlog::level::level_enum log_level_from_string(const std::string &name);

    void start_logger(
        const spdlog::level::level_enum level = spdlog::level::info,
        const std::string &logfile           = "");

    void start_logger(const LoggerOptions &options);

    void stop_logger();

} // namespace utility
} // namespace framestate
