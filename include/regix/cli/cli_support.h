#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <stop_token>
#include <thread>

namespace regix::cli {

/**
 * @brief Replace the default logger with one writing to stderr
 *
 * stdout carries only the JSON printed by commands, so engine warnings and debug output
 * never corrupt it.
 */
void installStderrLogger(spdlog::level::level_enum level);

// SIGINT/SIGTERM only set an atomic flag; nothing else runs in signal context.
void installSignalHandlers();

void requestInterrupt() noexcept;
bool interruptRequested() noexcept;
void resetInterrupt() noexcept;

/**
 * @brief Forwards the interrupt flag to a stop_source from an ordinary thread
 *
 * request_stop() runs stop callbacks synchronously and is not async-signal-safe, so the
 * handler never calls it directly. The watcher stops when the forwarder is destroyed.
 */
class InterruptForwarder {
public:
    explicit InterruptForwarder(
        std::stop_source target,
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20));

    InterruptForwarder(const InterruptForwarder&) = delete;
    InterruptForwarder& operator=(const InterruptForwarder&) = delete;

private:
    std::jthread watcher_;
};

} // namespace regix::cli
