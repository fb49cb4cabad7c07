#include "common/interrupt.hpp"
#include <csignal>
#include <cstring>
#include <signal.h>

namespace {

volatile std::sig_atomic_t pendingSignal_ = 0;

extern "C" void handleSignal(int signum) {
    pendingSignal_ = signum;
}

} // namespace

InterruptedError::InterruptedError(int signal)
    : std::runtime_error("Interrupted by signal " + std::to_string(signal)) {
}

void Interrupt::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: blocking waits must return so the flag gets checked
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

bool Interrupt::requested() {
    return pendingSignal_ != 0;
}

int Interrupt::pendingSignal() {
    return pendingSignal_;
}

void Interrupt::checkpoint() {
    int signum = pendingSignal_;
    if (signum != 0) {
        throw InterruptedError(signum);
    }
}

void Interrupt::reset() {
    pendingSignal_ = 0;
}

void Interrupt::raise(int signal) {
    pendingSignal_ = signal;
}
