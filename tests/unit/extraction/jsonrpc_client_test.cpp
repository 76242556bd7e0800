#include <cartograph/extraction/inference_client.h>
#include <cartograph/extraction/jsonrpc_client.h>
#include <cartograph/extraction/plugin_process.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>

using namespace cartograph;
using namespace cartograph::extraction;
using namespace std::chrono_literals;

namespace {

std::string getPythonExecutable() {
    if (const char* python = std::getenv("PYTHON"))
        return python;
    return "python3";
}

std::filesystem::path getMockPluginPath() {
    // tests/unit/extraction/<this file> -> tests/fixtures/
    return std::filesystem::path(__FILE__).parent_path().parent_path().parent_path() /
           "fixtures" / "mock_inference.py";
}

PluginProcessConfig mockConfig() {
    PluginProcessConfig config{.executable = getPythonExecutable(),
                               .args = {getMockPluginPath().string()}};
    config.with_env("PYTHONUNBUFFERED", "1");
    return config;
}

} // namespace

class JsonRpcClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::filesystem::exists(getMockPluginPath()))
            GTEST_SKIP() << "mock plugin fixture missing";
        try {
            process_ = std::make_unique<PluginProcess>(mockConfig());
        } catch (const std::runtime_error& e) {
            GTEST_SKIP() << "cannot spawn python: " << e.what();
        }
        if (!process_->is_alive())
            GTEST_SKIP() << "python not available";
        client_ = std::make_unique<JsonRpcClient>(*process_);
    }

    std::unique_ptr<PluginProcess> process_;
    std::unique_ptr<JsonRpcClient> client_;
};

TEST_F(JsonRpcClientTest, CallReturnsResult) {
    auto result = client_->call("ping", nlohmann::json::object(), 5s);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value()["status"], "ok");
}

TEST_F(JsonRpcClientTest, SequentialCallsKeepIdsInStep) {
    for (int i = 0; i < 5; ++i) {
        auto result = client_->call("ping", nlohmann::json::object(), 5s);
        ASSERT_TRUE(result);
    }
}

TEST_F(JsonRpcClientTest, RpcErrorIsInferenceUnavailable) {
    auto result = client_->call("nonexistent.method", nlohmann::json::object(), 5s);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InferenceUnavailable);
}

TEST_F(JsonRpcClientTest, MalformedResponsesAreInferenceUnavailable) {
    auto bare = client_->call("infer", {{"task", "bare"}}, 5s);
    ASSERT_FALSE(bare);
    EXPECT_EQ(bare.error().code, ErrorCode::InferenceUnavailable);

    auto stringError = client_->call("infer", {{"task", "string_error"}}, 5s);
    ASSERT_FALSE(stringError);
    EXPECT_EQ(stringError.error().code, ErrorCode::InferenceUnavailable);
    EXPECT_NE(stringError.error().message.find("plugin exploded"), std::string::npos);

    auto next = client_->call("ping", nlohmann::json::object(), 5s);
    ASSERT_TRUE(next) << next.error().message;
}

TEST_F(JsonRpcClientTest, SlowAnswerTimesOutAndLateReplyIsDiscarded) {
    auto slow = client_->call("infer", {{"task", "slow"}}, 200ms);
    ASSERT_FALSE(slow);
    EXPECT_EQ(slow.error().code, ErrorCode::Timeout);

    // The late reply to the slow request must not be taken for this one
    auto next = client_->call("ping", nlohmann::json::object(), 5s);
    ASSERT_TRUE(next) << next.error().message;
    EXPECT_EQ(next.value()["status"], "ok");
}

TEST_F(JsonRpcClientTest, NotificationDoesNotBlock) {
    client_->notify("log", {{"level", "info"}, {"message", "test"}});
    auto result = client_->call("ping", nlohmann::json::object(), 5s);
    EXPECT_TRUE(result);
}

TEST(PluginInferenceClientTest, DisabledConfigYieldsNoClient) {
    config::InferenceConfig cfg;
    cfg.enabled = false;
    cfg.command = "python3";
    EXPECT_EQ(makeInferenceClient(cfg), nullptr);

    cfg.enabled = true;
    cfg.command.clear();
    EXPECT_EQ(makeInferenceClient(cfg), nullptr);
}

TEST(PluginInferenceClientTest, AnswersTasksAndRespawnsAfterCrash) {
    if (!std::filesystem::exists(getMockPluginPath()))
        GTEST_SKIP() << "mock plugin fixture missing";

    PluginInferenceClient client{mockConfig()};
    InferenceRequest classify{"classify", "p1", "app/core.py", "python", {}};
    auto first = client.infer(classify, 5s);
    if (!first && first.error().code == ErrorCode::InferenceUnavailable)
        GTEST_SKIP() << "python not available: " << first.error().message;
    ASSERT_TRUE(first) << first.error().message;
    EXPECT_EQ(first.value()["component_type"], "logic");

    auto crash = client.infer({"crash", "p1", "x.py", "python", {}}, 2s);
    ASSERT_FALSE(crash);
    EXPECT_TRUE(crash.error().code == ErrorCode::InferenceUnavailable ||
                crash.error().code == ErrorCode::Timeout);

    auto again = client.infer(classify, 5s);
    ASSERT_TRUE(again) << again.error().message;
    EXPECT_EQ(again.value()["component_type"], "logic");
}
