#include <regix/cli/cli_support.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <csignal>
#include <memory>
#include <utility>

namespace regix::cli {

namespace {

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void handleSignal(int) {
    g_interrupted.store(true);
}

} // namespace

void installStderrLogger(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("regix", sink);
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

void installSignalHandlers() {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
}

void requestInterrupt() noexcept {
    g_interrupted.store(true);
}

bool interruptRequested() noexcept {
    return g_interrupted.load();
}

void resetInterrupt() noexcept {
    g_interrupted.store(false);
}

InterruptForwarder::InterruptForwarder(std::stop_source target,
                                       std::chrono::milliseconds pollInterval)
    : watcher_([target = std::move(target), pollInterval](std::stop_token self) mutable {
          while (!self.stop_requested()) {
              if (interruptRequested()) {
                  target.request_stop();
                  return;
              }
              std::this_thread::sleep_for(pollInterval);
          }
      }) {}

} // namespace regix::cli
