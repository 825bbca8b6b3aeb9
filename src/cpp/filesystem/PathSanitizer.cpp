/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/PathSanitizer.hpp>

#include <scratch/filesystem/TempDirError.hpp>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

fs::path sanitizePath(const fs::path& raw)
{
    // Root components always come first, so this also catches "/.." as a root escape.
    if (raw.has_root_name() || raw.has_root_directory()) {
        throw TempDirError{
            ErrorKind::ROOT_DIR_ESCAPE,
            raw,
            fmt::format("'{}' contains root dir", raw.string())};
    }

    fs::path res;
    for (const auto& component : raw) {
        if (component.empty() || component == ".") continue;
        if (component == "..") {
            throw TempDirError{
                ErrorKind::PARENT_DIR_ESCAPE,
                raw,
                fmt::format("'{}' contains parent dir", raw.string())};
        }
        res /= component;
    }
    return res;
}

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
