/*
 * test_supervisor_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-09

Description: Tests for supervisor configuration loading and validation

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config/supervisor_config.hpp"
#include "supervisor/exceptions.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace wayfarer::config;
using wayfarer::supervisor::ConfigError;
using wayfarer::supervisor::ServeLivenessPolicy;
using ::testing::HasSubstr;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class SupervisorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("wayfarer_config_" + std::string(info->name()) + "_" +
                std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto writeFile(const std::string& content) -> fs::path {
        auto path = dir_ / "wayfarer.json";
        std::ofstream(path) << content;
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// Defaults and JSON
// ============================================================================

TEST_F(SupervisorConfigTest, DefaultsAreValid) {
    SupervisorConfig config;
    EXPECT_EQ(config.validate(), "");
    EXPECT_EQ(config.idleTimeout, 600s);
    EXPECT_EQ(config.livenessPolicy, ServeLivenessPolicy::ProcessAlive);
    EXPECT_FALSE(config.port.has_value());
    EXPECT_EQ(config.engine.kind, "otp");
    EXPECT_TRUE(config.fetch.fetchTransit);
}

TEST_F(SupervisorConfigTest, SerializeDeserializePreservesValues) {
    SupervisorConfig config;
    config.graphName = "portland";
    config.bbox = wayfarer::fetch::BoundingBox{-122.8, 45.4, -122.5, 45.6};
    config.port = 8080;
    config.portRange = wayfarer::supervisor::PortRange{9000, 9100};
    config.freezeTimeout = 42s;
    config.pollInterval = 100ms;
    config.livenessPolicy = ServeLivenessPolicy::TcpProbe;
    config.engine.kind = "graphhopper";
    config.logging.consoleLevel = "debug";

    auto restored = SupervisorConfig::deserialize(config.serialize());
    EXPECT_EQ(restored.graphName, "portland");
    EXPECT_EQ(restored.bbox, config.bbox);
    EXPECT_EQ(restored.port, 8080);
    ASSERT_TRUE(restored.portRange.has_value());
    EXPECT_EQ(restored.portRange->first, 9000);
    EXPECT_EQ(restored.portRange->last, 9100);
    EXPECT_EQ(restored.freezeTimeout, 42s);
    EXPECT_EQ(restored.pollInterval, 100ms);
    EXPECT_EQ(restored.livenessPolicy, ServeLivenessPolicy::TcpProbe);
    EXPECT_EQ(restored.engine.kind, "graphhopper");
    EXPECT_EQ(restored.logging.consoleLevel, "debug");
}

TEST_F(SupervisorConfigTest, BboxAsArray) {
    auto config = SupervisorConfig::deserialize(
        json{{"bbox", {13.3, 52.4, 13.5, 52.6}}});
    ASSERT_TRUE(config.bbox.has_value());
    EXPECT_DOUBLE_EQ(config.bbox->left, 13.3);
    EXPECT_DOUBLE_EQ(config.bbox->top, 52.6);

    EXPECT_THROW((void)SupervisorConfig::deserialize(
                     json{{"bbox", {13.3, 52.4}}}),
                 ConfigError);
}

TEST_F(SupervisorConfigTest, MissingSectionsUseDefaults) {
    auto config = SupervisorConfig::deserialize(json::object());
    EXPECT_EQ(config.graphName, "default");
    EXPECT_EQ(config.fetch.parallelDownloads, 4U);
    EXPECT_TRUE(config.logging.enableConsole);
}

TEST_F(SupervisorConfigTest, UnknownPolicyIsRejected) {
    EXPECT_THROW((void)SupervisorConfig::deserialize(
                     json{{"livenessPolicy", "heartbeat"}}),
                 ConfigError);
    auto config = SupervisorConfig::deserialize(
        json{{"livenessPolicy", "output_activity"}});
    EXPECT_EQ(config.livenessPolicy, ServeLivenessPolicy::OutputActivity);
}

TEST_F(SupervisorConfigTest, SchemaListsSections) {
    auto schema = SupervisorConfig::schema();
    EXPECT_TRUE(schema["properties"].contains("engine"));
    EXPECT_TRUE(schema["properties"].contains("fetch"));
    EXPECT_TRUE(schema["properties"].contains("logging"));
    EXPECT_TRUE(schema["properties"].contains("livenessPolicy"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(SupervisorConfigTest, ValidateReportsFirstProblem) {
    SupervisorConfig config;

    config.graphName = "a/b";
    EXPECT_THAT(config.validate(), HasSubstr("graphName"));
    config.graphName = "berlin";

    config.bbox = wayfarer::fetch::BoundingBox{13.5, 52.4, 13.3, 52.6};
    EXPECT_THAT(config.validate(), HasSubstr("bbox"));
    config.bbox.reset();

    config.port = 70000;
    EXPECT_THAT(config.validate(), HasSubstr("port out of range"));
    config.port = 8080;
    config.securePort = 8080;
    EXPECT_THAT(config.validate(), HasSubstr("must differ"));
    config.securePort.reset();

    config.portRange = wayfarer::supervisor::PortRange{9100, 9000};
    EXPECT_THAT(config.validate(), HasSubstr("portRange"));
    config.portRange.reset();

    config.idleTimeout = 0s;
    EXPECT_THAT(config.validate(), HasSubstr("idleTimeout"));
    config.idleTimeout = 10s;

    config.maxProbeFailures = 0;
    EXPECT_THAT(config.validate(), HasSubstr("maxProbeFailures"));
    config.maxProbeFailures = 3;

    EXPECT_EQ(config.validate(), "");
}

TEST_F(SupervisorConfigTest, ValidateChecksSections) {
    SupervisorConfig config;
    config.engine.kind = "valhalla";
    EXPECT_THAT(config.validate(), HasSubstr("engine.kind"));
    config.engine.kind = "otp";

    config.fetch.parallelDownloads = 0;
    EXPECT_THAT(config.validate(), HasSubstr("parallelDownloads"));
    config.fetch.parallelDownloads = 2;

    config.logging.consoleLevel = "loud";
    EXPECT_THAT(config.validate(), HasSubstr("consoleLevel"));
}

TEST_F(SupervisorConfigTest, EngineDownloadMustBeAJar) {
    SupervisorConfig config;
    config.engine.kind = "graphhopper";
    config.engine.downloadUrl =
        "https://graphhopper.com/public/releases/"
        "graphhopper-web-0.9.0-bin.zip";
    EXPECT_THAT(config.validate(), HasSubstr("engine.downloadUrl"));

    config.engine.downloadUrl = "https://example.org/gh.tar.gz?mirror=1";
    EXPECT_THAT(config.validate(), HasSubstr("runnable jar"));

    config.engine.downloadUrl =
        "https://repo1.maven.org/maven2/com/graphhopper/graphhopper-web/"
        "0.9.0/graphhopper-web-0.9.0-with-dep.jar";
    EXPECT_EQ(config.validate(), "");

    config.engine.downloadUrl.clear();
    EXPECT_EQ(config.validate(), "");
}

TEST_F(SupervisorConfigTest, GraphDirectoryIsSanitized) {
    SupervisorConfig config;
    config.graphRoot = "graphs";
    config.graphName = "berlin (test)";
    EXPECT_EQ(config.graphDirectory(), fs::path("graphs") / "berlin _test_");
    EXPECT_EQ(sanitizeName("what?"), "what_");
    EXPECT_EQ(sanitizeName("plain-name"), "plain-name");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SupervisorConfigTest, LoadFromFileAcceptsComments) {
    auto path = writeFile(R"({
        // graph to serve
        "graphName": "portland",
        "bbox": {"left": -122.8, "bottom": 45.4, "right": -122.5, "top": 45.6},
        /* seconds */
        "idleTimeout": 120,
        "engine": {"kind": "graphhopper", "jarPath": "gh.jar"}
    })");

    auto config = SupervisorConfig::loadFromFile(path);
    EXPECT_EQ(config.graphName, "portland");
    EXPECT_EQ(config.idleTimeout, 120s);
    EXPECT_EQ(config.engine.jarPath, "gh.jar");
}

TEST_F(SupervisorConfigTest, LoadFromFileAcceptsNestedSection) {
    auto path = writeFile(R"({"supervisor": {"graphName": "nested"}})");
    EXPECT_EQ(SupervisorConfig::loadFromFile(path).graphName, "nested");
}

TEST_F(SupervisorConfigTest, LoadFromFileErrors) {
    EXPECT_THROW((void)SupervisorConfig::loadFromFile(dir_ / "missing.json"),
                 ConfigError);

    auto broken = writeFile("{ \"graphName\": ");
    EXPECT_THROW((void)SupervisorConfig::loadFromFile(broken), ConfigError);

    auto array = writeFile("[1, 2]");
    EXPECT_THROW((void)SupervisorConfig::loadFromFile(array), ConfigError);

    auto wrongType = writeFile(R"({"idleTimeout": "soon"})");
    EXPECT_THROW((void)SupervisorConfig::loadFromFile(wrongType), ConfigError);

    auto invalid = writeFile(R"({"maxBindRetries": -1})");
    try {
        (void)SupervisorConfig::loadFromFile(invalid);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("maxBindRetries"));
    }
}
