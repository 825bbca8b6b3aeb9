/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

inline constexpr std::string_view kRandomNamePrefix{"test-"};

// "test-" followed by a random v4 UUID in lowercase hyphenated form.
[[nodiscard]] std::string randomName();

// First component of a relative path, empty if it has none.
[[nodiscard]] std::filesystem::path topLevelComponent(const std::filesystem::path& relative);

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
