/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <filesystem>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

/**
 * Normalizes a path meant to live beneath the sandbox root.
 *
 * Normal components are kept in order, `.` and empty components are dropped.
 * A `..` component throws TempDirError{PARENT_DIR_ESCAPE}; a root directory
 * or root name (drive letter, UNC prefix) throws TempDirError{ROOT_DIR_ESCAPE}.
 * The result may be empty, e.g. for "." or "".
 *
 * Does not touch the filesystem.
 */
[[nodiscard]] std::filesystem::path sanitizePath(const std::filesystem::path& raw);

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
