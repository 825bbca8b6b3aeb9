/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <scratch/filesystem/SandboxRoot.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace scratch_tests::filesystem
{

//-------------------------------------------------------------------------

// Sets (or unsets, given std::nullopt) an environment variable for the scope.
class ScopedEnv
{
public:
    ScopedEnv(std::string name, const std::optional<std::string>& value)
        : m_name{std::move(name)}
    {
        if (const char* prev = std::getenv(m_name.c_str())) {
            m_previous = prev;
        }
        apply(value);
    }

    ~ScopedEnv() { apply(m_previous); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void apply(const std::optional<std::string>& value)
    {
#ifdef _WIN32
        ::_putenv_s(m_name.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            ::setenv(m_name.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
#endif
    }

    std::string m_name;
    std::optional<std::string> m_previous;
};

//-------------------------------------------------------------------------

// Points the sandbox root at a directory private to the test binary.
struct SandboxTest : ::testing::Test
{
    virtual void SetUp() override
    {
        const char* configured = std::getenv(std::string{scratch::filesystem::kSandboxRootEnvVar}.c_str());
        root = configured != nullptr && *configured != '\0'
            ? std::filesystem::path{configured}
            : std::filesystem::temp_directory_path() / "scratch-tests-out";
        std::filesystem::create_directories(root);
        env.emplace(std::string{scratch::filesystem::kSandboxRootEnvVar}, root.string());
    }

    virtual void TearDown() override
    {
        env.reset();
    }

    std::filesystem::path root;
    std::optional<ScopedEnv> env;
};

//-------------------------------------------------------------------------

}  // namespace scratch_tests::filesystem

//-------------------------------------------------------------------------
