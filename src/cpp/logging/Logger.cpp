/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/logging/Logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

//-------------------------------------------------------------------------

namespace scratch::logging
{

//-------------------------------------------------------------------------

spdlog::level::level_enum levelFromEnv()
{
    const char* value = std::getenv(kLevelEnvVar.data());
    if (value == nullptr || *value == '\0') {
        return kDefaultLevel;
    }

    const std::string name{value};
    const auto level = spdlog::level::from_str(name);
    // from_str maps anything it does not know to 'off'.
    if (level == spdlog::level::off && name != "off") {
        return kDefaultLevel;
    }
    return level;
}

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> logger()
{
    static const std::shared_ptr<spdlog::logger> s_logger = [] {
        const std::string name{kLoggerName};
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto res = spdlog::stderr_color_mt(name);
        res->set_level(levelFromEnv());
        res->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return res;
    }();
    return s_logger;
}

//-------------------------------------------------------------------------

}  // namespace scratch::logging

//-------------------------------------------------------------------------
