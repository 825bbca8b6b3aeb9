/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <scratch/filesystem/TempDirError.hpp>

#include <filesystem>

//-------------------------------------------------------------------------

namespace scratch::filesystem
{

//-------------------------------------------------------------------------

/**
 * A directory created beneath the sandbox root (see sandboxRoot()).
 *
 * The directory is left on disk by default. With auto-removal enabled, the
 * destructor removes the top-level directory of the target recursively, so
 * "foo/bar/baz" removes "<root>/foo" and everything beneath it. A failed
 * removal is logged and aborts the process.
 *
 * Move-assigning over a handle with auto-removal cleans up its old tree first,
 * which also removes the incoming directory if both share a top-level segment.
 *
 * Example:
 *   {
 *       auto dir = TempDir::createRandom().enableAutoRemove();
 *       std::ofstream ofs{dir.path() / "data.bin"};
 *       ...
 *   }  // <root>/test-<uuid> is gone
 */
class TempDir
{
public:
    // Throws TempDirError of any kind.
    [[nodiscard]] static TempDir create(const std::filesystem::path& path);
    [[nodiscard]] static TempDir createRandom();

    // Log the error and abort instead of throwing.
    [[nodiscard]] static TempDir createOrDie(const std::filesystem::path& path) noexcept;
    [[nodiscard]] static TempDir createRandomOrDie() noexcept;

    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;
    ~TempDir() noexcept;

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    TempDir& enableAutoRemove() & noexcept;
    [[nodiscard]] TempDir enableAutoRemove() && noexcept;

    [[nodiscard]] bool autoRemove() const noexcept { return m_autoRemove; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] const std::filesystem::path& target() const noexcept { return m_target; }

    operator const std::filesystem::path&() const noexcept { return m_path; }

private:
    TempDir(std::filesystem::path root, std::filesystem::path target) noexcept;

    void cleanup() noexcept;

    std::filesystem::path m_root;
    std::filesystem::path m_target;
    std::filesystem::path m_path;
    bool m_autoRemove{};
};

//-------------------------------------------------------------------------

}  // namespace scratch::filesystem

//-------------------------------------------------------------------------
