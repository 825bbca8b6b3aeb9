/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <filesystem>
#include <string_view>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

inline constexpr std::string_view kSandboxRootEnvVar{"SCRATCH_OUT_DIR"};

/**
 * Directory under which every TempDir is created, read from SCRATCH_OUT_DIR.
 *
 * The variable is read on each call. Throws TempDirError{ROOT_NOT_FOUND} when
 * it is unset, empty, relative, or does not name an existing directory.
 */
[[nodiscard]] std::filesystem::path sandboxRoot();

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
