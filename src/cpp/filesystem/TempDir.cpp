/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/TempDir.hpp>

#include <scratch/filesystem/PathSanitizer.hpp>
#include <scratch/filesystem/SandboxRoot.hpp>
#include <scratch/filesystem/utils.hpp>
#include <scratch/logging/Logger.hpp>

#include <cstdlib>
#include <utility>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

TempDir TempDir::create(const fs::path& path)
{
    auto target = sanitizePath(path);
    auto root = sandboxRoot();

    // An empty target would hand the sandbox root itself over for removal.
    if (target.empty()) {
        throw TempDirError{
            ErrorKind::INVALID_PATH,
            path,
            fmt::format("'{}' resolves to the sandbox root '{}'", path.string(), root.string())};
    }

    const auto full = root / target;
    std::error_code ec;
    fs::create_directories(full, ec);
    if (ec) {
        throw TempDirError{
            ErrorKind::IO,
            path,
            fmt::format("Failed to create '{}': {}", full.string(), ec.message()),
            ec};
    }

    logging::logger()->debug("Created '{}'", full.string());

    return TempDir{std::move(root), std::move(target)};
}

//-------------------------------------------------------------------------

TempDir TempDir::createRandom()
{
    return create(randomName());
}

//-------------------------------------------------------------------------

TempDir TempDir::createOrDie(const fs::path& path) noexcept
{
    try {
        return create(path);
    }
    catch (const std::exception& e) {
        logging::logger()->critical("Cannot create temporary directory: {}", e.what());
        logging::logger()->flush();
        std::abort();
    }
}

//-------------------------------------------------------------------------

TempDir TempDir::createRandomOrDie() noexcept
{
    return createOrDie(randomName());
}

//-------------------------------------------------------------------------

TempDir::TempDir(fs::path root, fs::path target) noexcept
    : m_root{std::move(root)},
      m_target{std::move(target)},
      m_path{m_root / m_target}
{}

//-------------------------------------------------------------------------

TempDir::TempDir(TempDir&& other) noexcept
    : m_root{std::move(other.m_root)},
      m_target{std::exchange(other.m_target, {})},
      m_path{std::move(other.m_path)},
      m_autoRemove{std::exchange(other.m_autoRemove, false)}
{}

//-------------------------------------------------------------------------

TempDir& TempDir::operator=(TempDir&& other) noexcept
{
    if (this != &other) {
        cleanup();
        m_root = std::move(other.m_root);
        m_target = std::exchange(other.m_target, {});
        m_path = std::move(other.m_path);
        m_autoRemove = std::exchange(other.m_autoRemove, false);
    }
    return *this;
}

//-------------------------------------------------------------------------

TempDir::~TempDir() noexcept
{
    cleanup();
}

//-------------------------------------------------------------------------

TempDir& TempDir::enableAutoRemove() & noexcept
{
    m_autoRemove = true;
    return *this;
}

//-------------------------------------------------------------------------

TempDir TempDir::enableAutoRemove() && noexcept
{
    m_autoRemove = true;
    return std::move(*this);
}

//-------------------------------------------------------------------------

void TempDir::cleanup() noexcept
{
    if (m_target.empty()) return;

    if (!m_autoRemove) {
        logging::logger()->debug("Keeping '{}'", m_path.string());
        return;
    }

    const auto top = topLevelComponent(m_target);
    if (top.empty()) return;

    const auto dir = m_root / top;
    std::error_code ec;
    const auto removed = fs::remove_all(dir, ec);
    if (ec) {
        logging::logger()->critical("Failed to remove '{}': {}", dir.string(), ec.message());
        logging::logger()->flush();
        std::abort();
    }
    if (removed == 0) {
        logging::logger()->critical("Failed to remove '{}': no such directory", dir.string());
        logging::logger()->flush();
        std::abort();
    }

    logging::logger()->debug("Removed '{}' ({} entries)", dir.string(), removed);
    m_target.clear();
    m_autoRemove = false;
}

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
