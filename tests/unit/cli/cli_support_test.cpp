#include <gtest/gtest.h>
#include <regix/cli/cli_support.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

using namespace regix::cli;
using namespace std::chrono_literals;

namespace {

bool waitFor(const std::stop_source& source, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!source.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(2ms);
    }
    return source.stop_requested();
}

} // namespace

class CliSupportTest : public ::testing::Test {
protected:
    void SetUp() override { previous_ = spdlog::default_logger(); }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
        resetInterrupt();
    }

    std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(CliSupportTest, LoggerWritesToStderrOnly) {
    installStderrLogger(spdlog::level::warn);

    auto logger = spdlog::default_logger();
    ASSERT_EQ(logger->sinks().size(), 1u);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(logger->sinks()[0]),
              nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    spdlog::warn("Search failed for '{}'", "q");
    spdlog::debug("hidden at warn level");
    logger->flush();
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("Search failed for 'q'"), std::string::npos);
    EXPECT_EQ(err.find("hidden"), std::string::npos);
}

TEST_F(CliSupportTest, VerboseLevelIsApplied) {
    installStderrLogger(spdlog::level::debug);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST_F(CliSupportTest, InterruptFlag) {
    EXPECT_FALSE(interruptRequested());
    requestInterrupt();
    EXPECT_TRUE(interruptRequested());
    resetInterrupt();
    EXPECT_FALSE(interruptRequested());
}

TEST_F(CliSupportTest, ForwarderSignalsStopSource) {
    std::stop_source source;
    InterruptForwarder forwarder(source, 2ms);

    std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(source.stop_requested());

    requestInterrupt();
    EXPECT_TRUE(waitFor(source, 1000ms));
}

TEST_F(CliSupportTest, ForwarderStopsQuietlyWithoutInterrupt) {
    std::stop_source source;
    {
        InterruptForwarder forwarder(source, 2ms);
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(source.stop_requested());
}
