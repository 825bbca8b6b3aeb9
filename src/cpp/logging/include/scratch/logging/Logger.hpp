/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

//-------------------------------------------------------------------------

namespace scratch::logging
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLoggerName{"scratch"};
inline constexpr std::string_view kLevelEnvVar{"SCRATCH_LOG_LEVEL"};
inline constexpr auto kDefaultLevel = spdlog::level::info;

// Level named by SCRATCH_LOG_LEVEL, kDefaultLevel if unset or unrecognized.
[[nodiscard]] spdlog::level::level_enum levelFromEnv();

// Shared stderr logger, created and registered with spdlog on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

//-------------------------------------------------------------------------

}  // namespace scratch::logging

//-------------------------------------------------------------------------
