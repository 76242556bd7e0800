#include <cartograph/extraction/plugin_process.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <span>
#include <string_view>

using namespace cartograph::extraction;
using namespace std::chrono_literals;

namespace {

std::span<const std::byte> to_bytes(std::string_view str) {
    return std::as_bytes(std::span{str.data(), str.size()});
}

} // namespace

TEST(PluginProcessTest, EchoesLinesThroughCat) {
    if (!std::filesystem::exists("/bin/cat"))
        GTEST_SKIP() << "/bin/cat not available";

    PluginProcess process{PluginProcessConfig{.executable = "/bin/cat"}};
    ASSERT_TRUE(process.is_alive());
    EXPECT_GT(process.pid(), 0);

    std::string_view first = "{\"jsonrpc\":\"2.0\",\"id\":1}\n";
    EXPECT_EQ(process.write_stdin(to_bytes(first)), first.size());
    auto line = process.read_line(3s);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "{\"jsonrpc\":\"2.0\",\"id\":1}");

    // Two lines written at once come back one at a time
    process.write_stdin(to_bytes("a\nb\n"));
    EXPECT_EQ(process.read_line(3s).value_or(""), "a");
    EXPECT_EQ(process.read_line(3s).value_or(""), "b");
}

TEST(PluginProcessTest, ReadLineTimesOutWithoutOutput) {
    if (!std::filesystem::exists("/bin/cat"))
        GTEST_SKIP() << "/bin/cat not available";

    PluginProcess process{PluginProcessConfig{.executable = "/bin/cat"}};
    auto line = process.read_line(100ms);
    EXPECT_FALSE(line.has_value());
    EXPECT_TRUE(process.is_alive());
}

TEST(PluginProcessTest, TerminateStopsProcess) {
    if (!std::filesystem::exists("/bin/cat"))
        GTEST_SKIP() << "/bin/cat not available";

    PluginProcess process{PluginProcessConfig{.executable = "/bin/cat"}};
    ASSERT_TRUE(process.is_alive());
    process.terminate(2s);
    EXPECT_FALSE(process.is_alive());
    EXPECT_EQ(process.state(), ProcessState::Terminated);
}

TEST(PluginProcessTest, MissingExecutableExitsWith127) {
    PluginProcess process{PluginProcessConfig{.executable = "/nonexistent/cartograph-plugin"}};
    ASSERT_TRUE(process.wait_for_exit(3s));
    EXPECT_FALSE(process.is_alive());
    EXPECT_EQ(process.exit_code().value_or(-1), 127);
}

TEST(PluginProcessTest, EnvironmentIsPassedToChild) {
    if (!std::filesystem::exists("/bin/sh"))
        GTEST_SKIP() << "/bin/sh not available";

    PluginProcessConfig config{.executable = "/bin/sh", .args = {"-c", "echo \"$CARTOGRAPH_X\""}};
    config.with_env("CARTOGRAPH_X", "from-test");
    PluginProcess process{std::move(config)};
    auto line = process.read_line(3s);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "from-test");
}
