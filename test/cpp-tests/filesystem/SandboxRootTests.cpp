/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <scratch/filesystem/SandboxRoot.hpp>
#include <scratch/filesystem/TempDirError.hpp>
#include <scratch_tests/filesystem/common.hpp>

#include <gmock/gmock.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace scratch::filesystem;
using namespace scratch_tests::filesystem;

using namespace testing;

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace
{

const std::string kVar{kSandboxRootEnvVar};

auto throwsRootNotFound()
{
    return Throws<TempDirError>(Field(&TempDirError::kind, ErrorKind::ROOT_NOT_FOUND));
}

}  // namespace

//-------------------------------------------------------------------------

TEST_F(SandboxTest, ResolvesFromEnvironment)
{
    EXPECT_EQ(sandboxRoot(), root.lexically_normal());
}

TEST(SandboxRoot, ReadOnEveryCall)
{
    const auto first = fs::temp_directory_path() / "scratch-root-a";
    const auto second = fs::temp_directory_path() / "scratch-root-b";
    fs::create_directories(first);
    fs::create_directories(second);

    ScopedEnv env{kVar, first.string()};
    EXPECT_EQ(sandboxRoot(), first);
    {
        ScopedEnv inner{kVar, second.string()};
        EXPECT_EQ(sandboxRoot(), second);
    }
    EXPECT_EQ(sandboxRoot(), first);
}

TEST(SandboxRoot, StripsTrailingSeparator)
{
    const auto dir = fs::temp_directory_path() / "scratch-root-trailing";
    fs::create_directories(dir);
    ScopedEnv env{kVar, dir.string() + "/"};

    EXPECT_EQ(sandboxRoot(), dir);
}

TEST(SandboxRoot, MissingDirectoryIsNotFound)
{
    const auto dir = fs::temp_directory_path() / "scratch-root-missing" / "deeper";
    fs::remove_all(dir.parent_path());
    ScopedEnv env{kVar, dir.string()};

    EXPECT_THAT(
        [] { [[maybe_unused]] auto root = sandboxRoot(); },
        Throws<TempDirError>(AllOf(
            Field(&TempDirError::kind, ErrorKind::ROOT_NOT_FOUND),
            Field(&TempDirError::path, dir))));
    EXPECT_FALSE(fs::exists(dir.parent_path()));
}

TEST(SandboxRoot, UnsetIsNotFound)
{
    ScopedEnv env{kVar, std::nullopt};

    EXPECT_THAT([] { [[maybe_unused]] auto root = sandboxRoot(); }, throwsRootNotFound());
}

TEST(SandboxRoot, EmptyIsNotFound)
{
    ScopedEnv env{kVar, ""};

    EXPECT_THAT([] { [[maybe_unused]] auto root = sandboxRoot(); }, throwsRootNotFound());
}

TEST(SandboxRoot, RelativeIsNotFound)
{
    ScopedEnv env{kVar, "relative/out"};

    EXPECT_THAT([] { [[maybe_unused]] auto root = sandboxRoot(); }, throwsRootNotFound());
}

TEST(SandboxRoot, RegularFileIsNotFound)
{
    const auto file = fs::temp_directory_path() / "scratch-root-file";
    std::ofstream{file} << "not a directory";
    ScopedEnv env{kVar, file.string()};

    EXPECT_THAT(
        [] { [[maybe_unused]] auto root = sandboxRoot(); },
        Throws<TempDirError>(AllOf(
            Field(&TempDirError::kind, ErrorKind::ROOT_NOT_FOUND),
            Field(&TempDirError::path, file))));

    fs::remove(file);
}

//-------------------------------------------------------------------------
