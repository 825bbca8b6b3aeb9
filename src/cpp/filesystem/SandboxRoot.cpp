/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/SandboxRoot.hpp>

#include <scratch/filesystem/TempDirError.hpp>

#include <cstdlib>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

fs::path sandboxRoot()
{
    const char* value = std::getenv(kSandboxRootEnvVar.data());
    if (value == nullptr || *value == '\0') {
        throw TempDirError{
            ErrorKind::ROOT_NOT_FOUND,
            {},
            fmt::format("Root dir for test not found, '{}' is not set", kSandboxRootEnvVar)};
    }

    const fs::path root{value};
    if (!root.is_absolute()) {
        throw TempDirError{
            ErrorKind::ROOT_NOT_FOUND,
            root,
            fmt::format("{}='{}' is not an absolute path", kSandboxRootEnvVar, root.string())};
    }

    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec || !fs::is_directory(status)) {
        throw TempDirError{
            ErrorKind::ROOT_NOT_FOUND,
            root,
            fmt::format(
                "{}='{}' is not an existing directory{}",
                kSandboxRootEnvVar,
                root.string(),
                ec ? fmt::format(" ({})", ec.message()) : ""),
            ec};
    }

    auto res = root.lexically_normal();
    if (!res.has_filename() && res.has_relative_path()) {
        res = res.parent_path();
    }
    return res;
}

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
