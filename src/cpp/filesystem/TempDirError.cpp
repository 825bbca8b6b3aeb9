/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/TempDirError.hpp>

#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

std::string_view errorKindName(ErrorKind kind) noexcept
{
    return magic_enum::enum_name(kind);
}

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
