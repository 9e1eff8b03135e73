#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace privgate {
namespace process {

// Checked at every subprocess wait point. A token is cancelled explicitly,
// by an interrupt signal once installed, or when its deadline passes.
class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    void setDeadline(std::chrono::steady_clock::time_point deadline) { deadline_ = deadline; }
    void setTimeout(std::chrono::milliseconds timeout);
    void clearDeadline() { deadline_.reset(); }

    bool isCancelled() const;
    bool deadlineExpired() const;

    // Routes SIGINT and SIGTERM to the process-wide interrupt flag.
    static void installSignalHandlers();
    static bool interruptRequested();
    static void resetInterrupt();

private:
    std::atomic<bool> cancelled_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    static std::atomic<bool> interrupt_requested_;
    static void signalHandlerStatic(int signal);
};

}}
