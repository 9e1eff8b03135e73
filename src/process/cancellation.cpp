#include "privgate/process/cancellation.hpp"
#include <csignal>

namespace privgate {
namespace process {

std::atomic<bool> CancellationToken::interrupt_requested_{false};

void CancellationToken::setTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        deadline_.reset();
        return;
    }
    deadline_ = std::chrono::steady_clock::now() + timeout;
}

bool CancellationToken::isCancelled() const {
    return cancelled_.load(std::memory_order_acquire) ||
           interrupt_requested_.load(std::memory_order_acquire) ||
           deadlineExpired();
}

bool CancellationToken::deadlineExpired() const {
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

void CancellationToken::installSignalHandlers() {
    signal(SIGINT, &CancellationToken::signalHandlerStatic);
    signal(SIGTERM, &CancellationToken::signalHandlerStatic);
}

bool CancellationToken::interruptRequested() {
    return interrupt_requested_.load(std::memory_order_acquire);
}

void CancellationToken::resetInterrupt() {
    interrupt_requested_.store(false, std::memory_order_release);
}

void CancellationToken::signalHandlerStatic(int /*signal*/) {
    interrupt_requested_.store(true, std::memory_order_release);
}

}}
