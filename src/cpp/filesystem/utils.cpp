/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/utils.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

std::string randomName()
{
    thread_local boost::uuids::random_generator s_gen;
    return fmt::format("{}{}", kRandomNamePrefix, boost::uuids::to_string(s_gen()));
}

//-------------------------------------------------------------------------

fs::path topLevelComponent(const fs::path& relative)
{
    if (relative.empty()) return {};
    return *relative.begin();
}

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
