#pragma once

#include <atomic>
#include <chrono>

namespace pilapse {

// Cancellation flag checked by the controller between capture steps. Safe to
// set from a signal handler.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request(int signalNumber = 0) noexcept;
    [[nodiscard]] bool isRequested() const noexcept;
    [[nodiscard]] int signalNumber() const noexcept;

    // Sleeps up to timeout; returns true as soon as cancellation is requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> requested_{false};
    std::atomic<int> signal_{0};
};

// Routes SIGINT and SIGTERM into a CancellationToken for its lifetime and
// restores the previous dispositions afterwards. Only one may be active.
class InterruptHandler {
public:
    explicit InterruptHandler(CancellationToken* token);
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler&) = delete;
    InterruptHandler& operator=(const InterruptHandler&) = delete;

    [[nodiscard]] bool installed() const { return installed_; }

private:
    bool installed_ = false;
};

}  // namespace pilapse
