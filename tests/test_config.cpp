/**
 * VOXRELAY - Realtime Voice Gateway
 * Unit tests for configuration loading
 */

#include "config/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace voxrelay::config;

namespace {

const std::vector<std::string> env_vars = {
    "VOXRELAY_CONFIG", "VOXRELAY_PORT", "VOXRELAY_THREADS", "VOXRELAY_WORKER_THREADS",
    "VOXRELAY_BIND", "VOXRELAY_CACHE_ENABLED", "VOXRELAY_CACHE_SIZE_MB", "VOXRELAY_CACHE_TTL",
    "VOXRELAY_BREAKER_THRESHOLD", "VOXRELAY_BREAKER_RECOVERY", "VOXRELAY_RETRY_MAX_ATTEMPTS",
    "VOXRELAY_SYNTHESIS", "VOXRELAY_SYNTHESIS_API_KEY", "VOXRELAY_TRANSCRIPTION",
    "VOXRELAY_TRANSCRIPTION_API_KEY", "VOXRELAY_TARGET_DBFS", "VOXRELAY_LOG_LEVEL",
    "VOXRELAY_LOG_FILE"
};

/**
 * argv builder that owns its strings
 */
class Args {
   public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "voxrelay");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

   private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class ConfigTest : public ::testing::Test {
   protected:
    fs::path temp_dir;
    fs::path config_path;

    void SetUp() override {
        for (const auto& name : env_vars) {
            unsetenv(name.c_str());
        }
        temp_dir = fs::temp_directory_path() /
                   ("voxrelay_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        fs::create_directories(temp_dir);
        config_path = temp_dir / "voxrelay.json";
    }

    void TearDown() override {
        for (const auto& name : env_vars) {
            unsetenv(name.c_str());
        }
        fs::remove_all(temp_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream file(config_path);
        file << content;
    }
};

// ============================================================
// Defaults
// ============================================================

TEST_F(ConfigTest, DefaultsMatchDeployment) {
    ConfigManager manager;
    Args args{};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.cache.ttl_seconds, 3600u);
    EXPECT_EQ(config.circuit_breaker.failure_threshold, 5u);
    EXPECT_EQ(config.circuit_breaker.recovery_timeout_seconds, 60u);
    EXPECT_EQ(config.circuit_breaker.success_threshold, 2u);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_DOUBLE_EQ(config.retry.min_wait_seconds, 1.0);
    EXPECT_DOUBLE_EQ(config.retry.multiplier, 2.0);
    EXPECT_DOUBLE_EQ(config.retry.max_wait_seconds, 10.0);
    EXPECT_EQ(config.synthesis.port, 8001);
    EXPECT_EQ(config.synthesis.path, "/v1/synthesize");
    EXPECT_EQ(config.transcription.port, 8002);
    EXPECT_EQ(config.transcription.path, "/v1/transcribe");
    EXPECT_DOUBLE_EQ(config.audio.target_dbfs, -20.0);
}

TEST_F(ConfigTest, HelpReturnsFalse) {
    ConfigManager manager;
    Args args{"--help"};
    EXPECT_FALSE(manager.load(args.argc(), args.argv()));
}

// ============================================================
// File, environment and CLI precedence
// ============================================================

TEST_F(ConfigTest, LoadsFileValuesOverDefaults) {
    write_config(R"({
        "server": {"port": 9100, "bind_address": "127.0.0.1"},
        "cache": {"ttl_seconds": 120},
        "circuit_breaker": {"failure_threshold": 3},
        "retry": {"max_attempts": 4, "min_wait_seconds": 0.5},
        "synthesis": {"host": "tts.internal", "port": 9001, "api_key": "secret"},
        "audio": {"post_process": false}
    })");

    ConfigManager manager;
    Args args{"--config", config_path.string()};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 9100);
    EXPECT_EQ(config.server.bind_address, "127.0.0.1");
    EXPECT_EQ(config.cache.ttl_seconds, 120u);
    EXPECT_EQ(config.circuit_breaker.failure_threshold, 3u);
    EXPECT_EQ(config.retry.max_attempts, 4u);
    EXPECT_DOUBLE_EQ(config.retry.min_wait_seconds, 0.5);
    EXPECT_EQ(config.synthesis.host, "tts.internal");
    EXPECT_EQ(config.synthesis.port, 9001);
    EXPECT_EQ(config.synthesis.path, "/v1/synthesize");
    EXPECT_EQ(config.synthesis.api_key, "secret");
    EXPECT_FALSE(config.audio.post_process);
    // Untouched sections keep their defaults
    EXPECT_EQ(config.transcription.port, 8002);
    EXPECT_EQ(manager.get_config_path(), config_path);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config(R"({"server": {"port": 9100}})");
    setenv("VOXRELAY_PORT", "9200", 1);
    setenv("VOXRELAY_SYNTHESIS", "tts.local:7000", 1);
    setenv("VOXRELAY_CACHE_ENABLED", "false", 1);

    ConfigManager manager;
    Args args{"-c", config_path.string()};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 9200);
    EXPECT_EQ(config.synthesis.host, "tts.local");
    EXPECT_EQ(config.synthesis.port, 7000);
    EXPECT_FALSE(config.cache.enabled);
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
    write_config(R"({"cache": {"max_size_mb": 64}})");
    setenv("VOXRELAY_CONFIG", config_path.string().c_str(), 1);

    ConfigManager manager;
    Args args{};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));
    EXPECT_EQ(manager.get_config().cache.max_size_mb, 64u);
}

TEST_F(ConfigTest, CliOverridesEnvironment) {
    setenv("VOXRELAY_PORT", "9200", 1);

    ConfigManager manager;
    Args args{"--port", "9300", "--workers=6", "--transcription", "asr:7100",
              "--log-level", "debug", "--no-cache"};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 9300);
    EXPECT_EQ(config.server.worker_threads, 6u);
    EXPECT_EQ(config.transcription.host, "asr");
    EXPECT_EQ(config.transcription.port, 7100);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.cache.enabled);
}

// ============================================================
// Validation
// ============================================================

TEST_F(ConfigTest, MissingFileIsAnError) {
    ConfigManager manager;
    Args args{"--config", (temp_dir / "absent.json").string()};
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigTest, InvalidJsonIsAnError) {
    write_config("{ not json");
    ConfigManager manager;
    Args args{"--config", config_path.string()};
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigTest, MalformedNumberIsAnError) {
    ConfigManager manager;
    Args args{"--port", "80x"};
    EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
}

TEST_F(ConfigTest, ZeroFailureThresholdIsRejected) {
    Config config;
    config.circuit_breaker.failure_threshold = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, InvertedRetryWaitsAreRejected) {
    Config config;
    config.retry.min_wait_seconds = 20.0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
    Config config;
    config.logging.level = "chatty";
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST_F(ConfigTest, EndpointPathMustBeAbsolute) {
    Config config;
    config.synthesis.path = "v1/synthesize";
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ParseHostPortTest, ParsesAndRejects) {
    EndpointSettings endpoint;
    parse_host_port("backend:9000", endpoint);
    EXPECT_EQ(endpoint.host, "backend");
    EXPECT_EQ(endpoint.port, 9000);

    EXPECT_THROW(parse_host_port("backend", endpoint), std::runtime_error);
    EXPECT_THROW(parse_host_port(":9000", endpoint), std::runtime_error);
    EXPECT_THROW(parse_host_port("backend:99999", endpoint), std::runtime_error);
}

// ============================================================
// Reload
// ============================================================

TEST_F(ConfigTest, ReloadNotifiesListeners) {
    write_config(R"({"logging": {"level": "info"}})");

    ConfigManager manager;
    Args args{"--config", config_path.string()};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    std::string seen_level;
    manager.on_reload([&](const Config& config) { seen_level = config.logging.level; });

    write_config(R"({"logging": {"level": "warn"}})");
    manager.reload();

    EXPECT_EQ(seen_level, "warn");
    EXPECT_EQ(manager.get_config().logging.level, "warn");
}

TEST_F(ConfigTest, FailedReloadKeepsCurrentConfig) {
    write_config(R"({"server": {"port": 9100}})");

    ConfigManager manager;
    Args args{"--config", config_path.string()};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    bool notified = false;
    manager.on_reload([&](const Config&) { notified = true; });

    write_config(R"({"server": {"port": 0}})");
    manager.reload();

    EXPECT_FALSE(notified);
    EXPECT_EQ(manager.get_config().server.port, 9100);
}

TEST_F(ConfigTest, ReloadKeepsCliPrecedence) {
    write_config(R"({"server": {"port": 9100}})");

    ConfigManager manager;
    Args args{"--config", config_path.string(), "--port", "9400"};
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    write_config(R"({"server": {"port": 9500}})");
    manager.reload();

    EXPECT_EQ(manager.get_config().server.port, 9400);
}

// ============================================================
// Serialization
// ============================================================

TEST(ConfigJsonTest, ApiKeysAreNeverSerialized) {
    Config config;
    config.synthesis.api_key = "secret";

    nlohmann::json j = config;
    EXPECT_FALSE(j["synthesis"].contains("api_key"));
    EXPECT_EQ(j["synthesis"]["port"], 8001);
}
