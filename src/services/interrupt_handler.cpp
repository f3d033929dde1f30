#include "pilapse/interrupt_handler.hpp"

#include <algorithm>
#include <thread>

#include <signal.h>

namespace pilapse {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{100};

std::atomic<CancellationToken*> g_token{nullptr};
struct sigaction g_previousInt;
struct sigaction g_previousTerm;

void onTerminationSignal(int signalNumber) {
    CancellationToken* token = g_token.load();
    if (token) {
        token->request(signalNumber);
    }
}

}  // namespace

void CancellationToken::request(int signalNumber) noexcept {
    signal_.store(signalNumber);
    requested_.store(true);
}

bool CancellationToken::isRequested() const noexcept {
    return requested_.load();
}

int CancellationToken::signalNumber() const noexcept {
    return signal_.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!isRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kWaitSlice));
    }
    return true;
}

InterruptHandler::InterruptHandler(CancellationToken* token) {
    CancellationToken* expected = nullptr;
    if (!token || !g_token.compare_exchange_strong(expected, token)) {
        return;
    }

    struct sigaction action {};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &action, &g_previousInt) != 0) {
        g_token.store(nullptr);
        return;
    }
    if (::sigaction(SIGTERM, &action, &g_previousTerm) != 0) {
        ::sigaction(SIGINT, &g_previousInt, nullptr);
        g_token.store(nullptr);
        return;
    }
    installed_ = true;
}

InterruptHandler::~InterruptHandler() {
    if (!installed_) {
        return;
    }
    ::sigaction(SIGINT, &g_previousInt, nullptr);
    ::sigaction(SIGTERM, &g_previousTerm, nullptr);
    g_token.store(nullptr);
}

}  // namespace pilapse
