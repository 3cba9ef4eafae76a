/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the configuration loader and transport settings
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 *
 * Covers:
 * - key=value parsing with typed values
 * - path restrictions and size limits on file loading
 * - mapping onto server, client, presence and fan-out settings
 */

#include <Lectern/Core/Config.hpp>
#include <Lectern/Core/NetworkConfig.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>

using namespace Lectern;
using namespace Lectern::Config;
using namespace Lectern::Testing;

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("lectern_config_test_" + randomString(8));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path path = testDir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path testDir_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, ParsesTypedValues) {
    ConfigLoader loader;
    auto result = loader.loadFromMemory(
        "# presenter settings\n"
        "server.name = Ms Smith\n"
        "server.port = 9999\n"
        "server.announce_presence = false\n"
        "fanout.ratio = 0.5\n"
        "client.machine_id = \"0042\"\n"
        "; another comment\n"
        "\n");
    ASSERT_LECTERN_SUCCESS(result);

    const ConfigMap& map = result.value();
    EXPECT_EQ(getString(map, "server.name"), "Ms Smith");
    EXPECT_EQ(getInt(map, "server.port"), 9999);
    EXPECT_EQ(getBool(map, "server.announce_presence"), false);
    EXPECT_DOUBLE_EQ(std::get<double>(map.at("fanout.ratio")), 0.5);
    // Quoted values stay strings
    EXPECT_EQ(getString(map, "client.machine_id"), "0042");
    EXPECT_EQ(map.size(), 5u);
}

TEST_F(ConfigLoaderTest, TypedLookupsRejectWrongType) {
    ConfigLoader loader;
    auto result = loader.loadFromMemory("port = abc\nname = 12\n");
    ASSERT_LECTERN_SUCCESS(result);

    EXPECT_FALSE(getInt(result.value(), "port").has_value());
    EXPECT_FALSE(getString(result.value(), "name").has_value());
    EXPECT_FALSE(getBool(result.value(), "missing").has_value());
}

TEST_F(ConfigLoaderTest, StrictModeRejectsMalformedLines) {
    ConfigLoader lenient;
    auto relaxed = lenient.loadFromMemory("garbage line\nkey = 1\n");
    ASSERT_LECTERN_SUCCESS(relaxed);
    EXPECT_EQ(relaxed.value().size(), 1u);

    ConfigLoader::Options options;
    options.strict = true;
    ConfigLoader strict(options);
    EXPECT_LECTERN_ERROR(strict.loadFromMemory("garbage line\nkey = 1\n"), ErrorCode::ConfigParseFailed);
    EXPECT_LECTERN_ERROR(strict.loadFromMemory("= value\n"), ErrorCode::ConfigParseFailed);
}

// ============================================================================
// File loading
// ============================================================================

TEST_F(ConfigLoaderTest, LoadsFile) {
    fs::path path = writeFile("presenter.conf", "server.port = 12000\n");

    ConfigLoader loader;
    auto result = loader.load(path.string());
    ASSERT_LECTERN_SUCCESS(result);
    EXPECT_EQ(getInt(result.value(), "server.port"), 12000);
}

TEST_F(ConfigLoaderTest, MissingFile) {
    ConfigLoader loader;
    EXPECT_LECTERN_ERROR(loader.load((testDir_ / "nope.conf").string()), ErrorCode::ConfigFileNotFound);
}

TEST_F(ConfigLoaderTest, FileSizeLimit) {
    fs::path path = writeFile("big.conf", std::string(4096, '#'));

    ConfigLoader::Options options;
    options.max_file_size = 1024;
    ConfigLoader loader(options);

    EXPECT_LECTERN_ERROR(loader.load(path.string()), ErrorCode::FileTooLarge);
    EXPECT_LECTERN_ERROR(loader.loadFromMemory(std::string(2048, '#')), ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, AllowedDirectoryEnforced) {
    fs::path allowed = testDir_ / "allowed";
    fs::create_directories(allowed);
    fs::path inside = writeFile("allowed/ok.conf", "a = 1\n");
    fs::path outside = writeFile("outside.conf", "a = 1\n");

    ConfigLoader::Options options;
    options.allowed_directory = allowed.string();
    ConfigLoader loader(options);

    ASSERT_LECTERN_SUCCESS(loader.load(inside.string()));
    EXPECT_LECTERN_ERROR(loader.load(outside.string()), ErrorCode::AccessDenied);

    // Traversal out of the allowed directory resolves to the outside file
    std::string traversal = (allowed / ".." / "outside.conf").string();
    EXPECT_LECTERN_ERROR(loader.load(traversal), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, DirectoryIsNotAFile) {
    ConfigLoader loader;
    EXPECT_LECTERN_ERROR(loader.load(testDir_.string()), ErrorCode::InvalidPath);
}

// ============================================================================
// Transport settings
// ============================================================================

TEST_F(ConfigLoaderTest, ServerDefaults) {
    auto config = makeServerConfig(ConfigMap{});
    ASSERT_LECTERN_SUCCESS(config);

    EXPECT_EQ(config.value().port, 9999);
    EXPECT_EQ(config.value().heartbeatTimeout, Milliseconds(15000));
    EXPECT_TRUE(config.value().announcePresence);
    EXPECT_EQ(config.value().presence.group, "239.255.255.250");
    EXPECT_EQ(config.value().presence.port, 10000);
    EXPECT_EQ(config.value().presence.announceInterval, Milliseconds(5000));
}

TEST_F(ConfigLoaderTest, ServerOverrides) {
    ConfigLoader loader;
    auto map = loader.loadFromMemory(
        "server.name = Room 12\n"
        "server.channel = 4\n"
        "server.port = 19999\n"
        "server.max_participants = 3\n"
        "server.heartbeat_timeout_ms = 2000\n"
        "server.announce_presence = false\n"
        "presence.port = 11000\n"
        "presence.interval_ms = 250\n");
    ASSERT_LECTERN_SUCCESS(map);

    auto config = makeServerConfig(map.value());
    ASSERT_LECTERN_SUCCESS(config);
    EXPECT_EQ(config.value().presenterName, "Room 12");
    EXPECT_EQ(config.value().channel, 4);
    EXPECT_EQ(config.value().port, 19999);
    EXPECT_EQ(config.value().maxParticipants, 3u);
    EXPECT_EQ(config.value().heartbeatTimeout, Milliseconds(2000));
    EXPECT_FALSE(config.value().announcePresence);
    EXPECT_EQ(config.value().presence.port, 11000);
    EXPECT_EQ(config.value().presence.announceInterval, Milliseconds(250));
}

TEST_F(ConfigLoaderTest, ServerRejectsInvalidValues) {
    ConfigLoader loader;

    for (const char* text : {
             "server.port = 70000\n",
             "server.port = 0\n",
             "server.port = ninety\n",
             "server.max_participants = 0\n",
             "server.heartbeat_timeout_ms = -5\n",
             "server.bind_address = not.an.ip\n",
             "server.name = \"\"\n",
             "presence.group = 1.2.3\n",
         }) {
        auto map = loader.loadFromMemory(text);
        ASSERT_LECTERN_SUCCESS(map);
        EXPECT_LECTERN_ERROR(makeServerConfig(map.value()), ErrorCode::ConfigInvalid);
    }
}

TEST_F(ConfigLoaderTest, ClientSettings) {
    ConfigLoader loader;
    auto map = loader.loadFromMemory(
        "client.name = Ann\n"
        "client.machine_id = lab-07\n"
        "client.accept_timeout_ms = 1500\n"
        "client.heartbeat_interval_ms = 1000\n");
    ASSERT_LECTERN_SUCCESS(map);

    auto config = makeClientConfig(map.value());
    ASSERT_LECTERN_SUCCESS(config);
    EXPECT_EQ(config.value().participantName, "Ann");
    EXPECT_EQ(config.value().machineId, "lab-07");
    EXPECT_EQ(config.value().acceptTimeout, Milliseconds(1500));
    EXPECT_EQ(config.value().heartbeatInterval, Milliseconds(1000));
    EXPECT_EQ(config.value().connectTimeout, Milliseconds(5000));

    auto bad = loader.loadFromMemory("client.heartbeat_interval_ms = 0\n");
    ASSERT_LECTERN_SUCCESS(bad);
    EXPECT_LECTERN_ERROR(makeClientConfig(bad.value()), ErrorCode::ConfigInvalid);
}

TEST_F(ConfigLoaderTest, FanoutSettings) {
    auto defaults = makeFanoutConfig(ConfigMap{});
    ASSERT_LECTERN_SUCCESS(defaults);
    EXPECT_EQ(defaults.value().group, "239.255.1.1");
    EXPECT_EQ(defaults.value().port, 5005);
    EXPECT_EQ(defaults.value().ttl, 32);
    EXPECT_EQ(defaults.value().compressionLevel, 1);

    ConfigLoader loader;
    auto map = loader.loadFromMemory("fanout.ttl = 4\nfanout.compression_level = 9\n");
    ASSERT_LECTERN_SUCCESS(map);
    auto config = makeFanoutConfig(map.value());
    ASSERT_LECTERN_SUCCESS(config);
    EXPECT_EQ(config.value().ttl, 4);
    EXPECT_EQ(config.value().compressionLevel, 9);

    auto bad = loader.loadFromMemory("fanout.ttl = 300\n");
    ASSERT_LECTERN_SUCCESS(bad);
    EXPECT_LECTERN_ERROR(makeFanoutConfig(bad.value()), ErrorCode::ConfigInvalid);
}
