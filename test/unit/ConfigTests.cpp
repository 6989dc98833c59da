/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ConfigTests.cpp

Abstract:

    This file contains tests for the config file parser and the settings loader.

--*/

#include <stdlib.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "ShimConfig.h"
#include "configfile.h"

using namespace std::chrono_literals;
using vmshim::config::ShimConfig;

namespace {

const char* const c_environment[] = {
    vmshim::config::c_configEnvironment,
    vmshim::config::c_maxParallelStartEnvironment,
    vmshim::config::c_timeoutOperationsEnvironment,
    vmshim::config::c_timeoutSystemCreateEnvironment,
    vmshim::config::c_timeoutSystemStartEnvironment,
    vmshim::config::c_timeoutSystemPauseEnvironment,
    vmshim::config::c_timeoutSystemResumeEnvironment,
};

using unique_file = std::unique_ptr<FILE, decltype(&fclose)>;

unique_file OpenContent(const std::string& Content)
{
    unique_file file(tmpfile(), &fclose);
    if (file)
    {
        fputs(Content.c_str(), file.get());
        rewind(file.get());
    }

    return file;
}

class ConfigTests : public testing::Test
{
protected:
    void SetUp() override
    {
        ClearEnvironment();
    }

    void TearDown() override
    {
        ClearEnvironment();

        std::error_code error;
        for (const auto& path : m_files)
        {
            std::filesystem::remove(path, error);
        }
    }

    std::string WriteConfig(const std::string& Content)
    {
        const auto* test = testing::UnitTest::GetInstance()->current_test_info();
        auto path = std::filesystem::temp_directory_path() / (std::string("vmshim-") + test->name() + "-" + std::to_string(m_files.size()) + ".conf");

        std::ofstream stream(path, std::ios::trunc);
        stream << Content;
        stream.close();

        m_files.push_back(path);
        return path.string();
    }

    static void ClearEnvironment()
    {
        for (const auto* name : c_environment)
        {
            unsetenv(name);
        }
    }

private:
    std::vector<std::filesystem::path> m_files;
};

TEST_F(ConfigTests, Sections)
{
    int maxParallel = 0;
    std::string level;
    std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", maxParallel), ConfigKey("log.level", level)};

    auto file = OpenContent(
        "# leading comment\n"
        "; another comment\n"
        "\n"
        "[start]\n"
        "    maxParallel = 4   # trailing comment\n"
        "[ log ]\n"
        "level=debug\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(maxParallel, 4);
    EXPECT_EQ(level, "debug");
}

TEST_F(ConfigTests, KeysAreCaseInsensitive)
{
    int maxParallel = 0;
    std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", maxParallel)};

    auto file = OpenContent("[Start]\nMAXPARALLEL = 3\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(maxParallel, 3);
}

TEST_F(ConfigTests, IntegerBases)
{
    int hex = 0;
    int octal = 0;
    std::vector<ConfigKey> keys = {ConfigKey("timeout.operations", hex), ConfigKey("timeout.systemStart", octal)};

    auto file = OpenContent("[timeout]\noperations = 0xF0\nsystemStart = 010\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(hex, 240);
    EXPECT_EQ(octal, 8);
}

TEST_F(ConfigTests, QuotesAndEscapes)
{
    std::string quoted;
    std::string escaped;
    std::string hash;
    std::vector<ConfigKey> keys = {ConfigKey("values.quoted", quoted), ConfigKey("values.escaped", escaped), ConfigKey("values.hash", hash)};

    auto file = OpenContent(
        "[values]\n"
        "quoted = \"  spaced  \"\n"
        "escaped = a\\tb\\n\\\\\\\"\n"
        "hash = \"#not a comment\" ; comment\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(quoted, "  spaced  ");
    EXPECT_EQ(escaped, "a\tb\n\\\"");
    EXPECT_EQ(hash, "#not a comment");
}

TEST_F(ConfigTests, LineContinuation)
{
    std::string value;
    int after = 0;
    std::vector<ConfigKey> keys = {ConfigKey("values.long", value), ConfigKey("values.after", after)};

    auto file = OpenContent("[values]\nlong = first \\\nsecond\nafter = 1\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(value, "first second");
    EXPECT_EQ(after, 1);
}

TEST_F(ConfigTests, InvalidLines)
{
    int value = 0;
    std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", value)};

    for (const auto* content : {"[start\nmaxParallel = 1\n", "maxParallel = 1\n", "[start]\nmaxParallel\n", "[start]\nmaxParallel = \"open\n", "[start]\nmaxParallel = \\q\n"})
    {
        SCOPED_TRACE(content);

        auto file = OpenContent(content);
        ASSERT_TRUE(file);
        EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), -1);
    }

    value = 0;
    std::vector<ConfigKey> skipKeys = {ConfigKey("start.maxParallel", value)};
    auto file = OpenContent("[start]\nbogus line\nmaxParallel = 6\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(skipKeys, file.get(), CFG_SKIP_INVALID_LINES, "test.conf"), 0);
    EXPECT_EQ(value, 6);
}

TEST_F(ConfigTests, UnknownKeys)
{
    int value = 0;

    {
        std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", value)};
        auto file = OpenContent("[start]\nunknown = 1\nmaxParallel = 2\n");
        ASSERT_TRUE(file);
        EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), -1);
    }

    {
        std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", value)};
        auto file = OpenContent("[start]\nunknown = 1\nmaxParallel = 2\n");
        ASSERT_TRUE(file);
        EXPECT_EQ(ParseConfigFile(keys, file.get(), CFG_SKIP_UNKNOWN_VALUES, "test.conf"), 0);
        EXPECT_EQ(value, 2);
    }
}

TEST_F(ConfigTests, FirstDuplicateWins)
{
    int value = 0;
    ConfigKeyPresence presence = ConfigKeyPresence::Absent;
    std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", value, &presence)};

    auto file = OpenContent("[start]\nmaxParallel = 1\nmaxParallel = 2\n");
    ASSERT_TRUE(file);

    EXPECT_EQ(ParseConfigFile(keys, file.get(), 0, "test.conf"), 0);
    EXPECT_EQ(value, 1);
    EXPECT_EQ(presence, ConfigKeyPresence::Present);
}

TEST_F(ConfigTests, NullFileKeepsDefaults)
{
    int value = 5;
    std::vector<ConfigKey> keys = {ConfigKey("start.maxParallel", value)};

    EXPECT_EQ(ParseConfigFile(keys, nullptr, 0, "missing.conf"), 0);
    EXPECT_EQ(value, 5);
}

TEST_F(ConfigTests, Defaults)
{
    const auto config = ShimConfig::Load();

    EXPECT_EQ(config.MaxParallelStart, 0);
    EXPECT_EQ(config.Timeouts.SystemCreate, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.SystemStart, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.SystemPause, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.SystemResume, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.ForceUnblockGracePeriod, vmshim::config::c_defaultForceUnblockGracePeriod);
    EXPECT_EQ(config.LogLevel, vmshim::log::Level::Info);
}

TEST_F(ConfigTests, MissingFileKeepsDefaults)
{
    const auto path = (std::filesystem::temp_directory_path() / "vmshim-does-not-exist.conf").string();
    const auto config = ShimConfig::Load(path.c_str());

    EXPECT_EQ(config.MaxParallelStart, 0);
    EXPECT_EQ(config.Timeouts.SystemStart, vmshim::config::c_defaultOperationTimeout);
}

TEST_F(ConfigTests, FileSettings)
{
    const auto path = WriteConfig(
        "[start]\n"
        "maxParallel = 3\n"
        "[timeout]\n"
        "operations = 30\n"
        "systemStart = 90\n"
        "[process]\n"
        "forceUnblockMs = 250\n"
        "[log]\n"
        "level = DEBUG\n");

    const auto config = ShimConfig::Load(path.c_str());

    EXPECT_EQ(config.MaxParallelStart, 3);
    EXPECT_EQ(config.Timeouts.SystemCreate, 30s);
    EXPECT_EQ(config.Timeouts.SystemStart, 90s);
    EXPECT_EQ(config.Timeouts.SystemPause, 30s);
    EXPECT_EQ(config.Timeouts.SystemResume, 30s);
    EXPECT_EQ(config.Timeouts.ForceUnblockGracePeriod, 250ms);
    EXPECT_EQ(config.LogLevel, vmshim::log::Level::Debug);
}

TEST_F(ConfigTests, InvalidValuesAreIgnored)
{
    const auto path = WriteConfig(
        "[start]\n"
        "maxParallel = many\n"
        "[timeout]\n"
        "operations = 0\n"
        "systemPause = -5\n"
        "[process]\n"
        "forceUnblockMs = 0\n"
        "[log]\n"
        "level = verbose\n"
        "[unknown]\n"
        "key = value\n"
        "not a key value line\n");

    const auto config = ShimConfig::Load(path.c_str());

    EXPECT_EQ(config.MaxParallelStart, 0);
    EXPECT_EQ(config.Timeouts.SystemCreate, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.SystemPause, vmshim::config::c_defaultOperationTimeout);
    EXPECT_EQ(config.Timeouts.ForceUnblockGracePeriod, vmshim::config::c_defaultForceUnblockGracePeriod);
    EXPECT_EQ(config.LogLevel, vmshim::log::Level::Info);
}

TEST_F(ConfigTests, EnvironmentOverridesFile)
{
    const auto path = WriteConfig("[start]\nmaxParallel = 3\n[timeout]\noperations = 30\nsystemCreate = 10\n");

    ASSERT_EQ(setenv(vmshim::config::c_maxParallelStartEnvironment, "1", 1), 0);
    ASSERT_EQ(setenv(vmshim::config::c_timeoutOperationsEnvironment, "60", 1), 0);
    ASSERT_EQ(setenv(vmshim::config::c_timeoutSystemResumeEnvironment, "5", 1), 0);

    // Non-positive timeouts do not override.
    ASSERT_EQ(setenv(vmshim::config::c_timeoutSystemCreateEnvironment, "0", 1), 0);

    const auto config = ShimConfig::Load(path.c_str());

    EXPECT_EQ(config.MaxParallelStart, 1);
    EXPECT_EQ(config.Timeouts.SystemCreate, 10s);
    EXPECT_EQ(config.Timeouts.SystemStart, 60s);
    EXPECT_EQ(config.Timeouts.SystemPause, 60s);
    EXPECT_EQ(config.Timeouts.SystemResume, 5s);
}

TEST_F(ConfigTests, EnvironmentMaxParallelStart)
{
    const auto path = WriteConfig("[start]\nmaxParallel = 3\n");

    // Zero disables the throttle. Negative and malformed values are ignored.
    ASSERT_EQ(setenv(vmshim::config::c_maxParallelStartEnvironment, "0", 1), 0);
    EXPECT_EQ(ShimConfig::Load(path.c_str()).MaxParallelStart, 0);

    ASSERT_EQ(setenv(vmshim::config::c_maxParallelStartEnvironment, "-1", 1), 0);
    EXPECT_EQ(ShimConfig::Load(path.c_str()).MaxParallelStart, 3);

    ASSERT_EQ(setenv(vmshim::config::c_maxParallelStartEnvironment, "two", 1), 0);
    EXPECT_EQ(ShimConfig::Load(path.c_str()).MaxParallelStart, 3);
}

TEST_F(ConfigTests, ConfigPathFromEnvironment)
{
    const auto path = WriteConfig("[start]\nmaxParallel = 7\n");
    ASSERT_EQ(setenv(vmshim::config::c_configEnvironment, path.c_str(), 1), 0);

    EXPECT_EQ(ShimConfig::Load().MaxParallelStart, 7);

    // An explicit path takes precedence.
    const auto other = WriteConfig("[start]\nmaxParallel = 2\n");
    EXPECT_EQ(ShimConfig::Load(other.c_str()).MaxParallelStart, 2);
}

} // namespace
