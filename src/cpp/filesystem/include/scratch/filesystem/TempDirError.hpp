/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <source_location>
#include <stdexcept>
#include <string_view>
#include <string>
#include <system_error>
#include <utility>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

enum class ErrorKind : uint32_t
{
    IO,
    PARENT_DIR_ESCAPE,
    ROOT_DIR_ESCAPE,
    ROOT_NOT_FOUND,
    INVALID_PATH
};

[[nodiscard]] std::string_view errorKindName(ErrorKind kind) noexcept;

//-------------------------------------------------------------------------

struct TempDirError : std::exception
{
    ErrorKind kind;
    std::filesystem::path path;
    std::error_code code;
    std::string message;

    TempDirError(
        ErrorKind kind,
        std::filesystem::path path = {},
        std::string_view msg = {},
        std::error_code code = {},
        std::source_location sl = std::source_location::current()) noexcept
        : kind{kind}, path{std::move(path)}, code{code}
    {
        message = fmt::format(
            "TempDir error @ {}#L{}: {}{}",
            sl.file_name(),
            sl.line(),
            errorKindName(kind),
            msg.empty() ? "" : fmt::format(": {}", msg));
    }

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
