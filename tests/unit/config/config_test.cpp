#include <cartograph/config/config.h>
#include <cartograph/config/config_helpers.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace cartograph;
using namespace cartograph::config;
using cartograph::tests::make_temp_dir;
using cartograph::tests::write_file;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir("cartograph_config_"); }

    void TearDown() override {
        for (const char* var : {"CARTOGRAPH_DB_PATH", "CARTOGRAPH_WORKERS",
                                "CARTOGRAPH_INFERENCE_CMD", "CARTOGRAPH_LOG_LEVEL"})
            ::unsetenv(var);
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto cfg = loadConfig(dir_ / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().resolver.closureDepth, 3);
    EXPECT_EQ(cfg.value().pipeline.maxAttempts, 4);
    EXPECT_FALSE(cfg.value().inference.enabled);
    EXPECT_EQ(cfg.value().store.path.filename(), "graph.db");
    EXPECT_EQ(cfg.value().logLevel, "info");
}

TEST_F(ConfigTest, ReadsSectionsFromToml) {
    auto path = write_file(dir_ / "config.toml", R"(
# cartograph settings
[store]
path = "/var/lib/cartograph/graph.db"
pool_size = 8

[extraction]
workers = 3
max_file_size = 1024
skip_hidden = false

[inference]
command = "python3"
args = ["infer.py", "--fast"]
timeout_ms = 1500

[resolver]
closure_depth = 5

[pipeline]
max_attempts = 2
backoff_initial_ms = 10

[logging]
level = "debug"
)");

    auto cfgR = loadConfig(path);
    ASSERT_TRUE(cfgR) << cfgR.error().message;
    const auto& cfg = cfgR.value();
    EXPECT_EQ(cfg.store.path, "/var/lib/cartograph/graph.db");
    EXPECT_EQ(cfg.store.poolSize, 8u);
    EXPECT_EQ(cfg.extraction.workers, 3u);
    EXPECT_EQ(cfg.effectiveWorkers(), 3u);
    EXPECT_EQ(cfg.extraction.maxFileSize, 1024u);
    EXPECT_FALSE(cfg.extraction.skipHidden);
    EXPECT_TRUE(cfg.inference.enabled);
    EXPECT_EQ(cfg.inference.command, "python3");
    ASSERT_EQ(cfg.inference.args.size(), 2u);
    EXPECT_EQ(cfg.inference.args[1], "--fast");
    EXPECT_EQ(cfg.inference.timeout, std::chrono::milliseconds{1500});
    EXPECT_EQ(cfg.resolver.closureDepth, 5);
    EXPECT_EQ(cfg.pipeline.maxAttempts, 2);
    EXPECT_EQ(cfg.pipeline.backoffInitial, std::chrono::milliseconds{10});
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST_F(ConfigTest, RejectsInvalidNumbers) {
    auto path = write_file(dir_ / "bad.toml", "[resolver]\nclosure_depth = 0\n");
    auto cfg = loadConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);

    path = write_file(dir_ / "bad2.toml", "[extraction]\nworkers = many\n");
    EXPECT_FALSE(loadConfig(path));
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = write_file(dir_ / "config.toml", "[extraction]\nworkers = 2\n");
    auto cfgR = loadConfig(path);
    ASSERT_TRUE(cfgR);
    auto cfg = cfgR.value();

    ::setenv("CARTOGRAPH_WORKERS", "6", 1);
    ::setenv("CARTOGRAPH_DB_PATH", "/tmp/other.db", 1);
    ::setenv("CARTOGRAPH_INFERENCE_CMD", "/usr/bin/infer", 1);
    applyEnvironmentOverrides(cfg);

    EXPECT_EQ(cfg.extraction.workers, 6u);
    EXPECT_EQ(cfg.store.path, "/tmp/other.db");
    EXPECT_TRUE(cfg.inference.enabled);
    EXPECT_EQ(cfg.inference.command, "/usr/bin/infer");
}

TEST_F(ConfigTest, InvalidWorkerOverrideIsIgnored) {
    Config cfg = defaultConfig();
    cfg.extraction.workers = 4;
    ::setenv("CARTOGRAPH_WORKERS", "-3", 1);
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.extraction.workers, 4u);
}

TEST(ConfigHelpersTest, ParsesDurationsAndLists) {
    EXPECT_EQ(parse_ms("250"), std::chrono::milliseconds{250});
    auto list = parse_string_list(R"(["a", "b c"])");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "a");
    EXPECT_EQ(list[1], "b c");
}
