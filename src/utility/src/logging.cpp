// SPDX-License-Identifier: Apache-2.0

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "framestate/utility/logging.hpp"
#include "framestate/utility/preferences.hpp"

using namespace framestate::utility;

LoggerOptions LoggerOptions::from_preferences(const JsonStore &prefs) {

    LoggerOptions opts;
    try {
        opts.level = log_level_from_string(
            preference_value<std::string>(prefs, "/framestate/log/level", "info"));
        opts.logfile = preference_value<std::string>(prefs, "/framestate/log/file", "");
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
    }
    return opts;
}

spdlog::level::level_enum framestate::utility::log_level_from_string(const std::string &name) {

    const auto level = spdlog::level::from_str(name);
    // from_str returns off for unknown names, only honour it when asked for
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level \"{}\", using info", name);
        return spdlog::level::info;
    }
    return level;
}

void framestate::utility::start_logger(
    const spdlog::level::level_enum level, const std::string &logfile) {

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!logfile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile, true));
        } catch (const spdlog::spdlog_ex &e) {
            spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("framestate", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void framestate::utility::start_logger(const LoggerOptions &options) {
    start_logger(options.level, options.logfile);
}

void framestate::utility::stop_logger() {
    spdlog::default_logger()->flush();
    // fall back to an unnamed console logger, later log calls must stay valid
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
}
