#pragma once

#include <stdexcept>
#include <string>

// Raised at the next command boundary after SIGINT, SIGTERM or SIGHUP so
// that scoped resources (tunnel configs, pending snapshots, status guards)
// unwind before the process exits.
class InterruptedError : public std::runtime_error {
public:
    explicit InterruptedError(int signal);
};

class Interrupt {
public:
    static void install();
    static bool requested();
    static int pendingSignal();

    // Throws InterruptedError if a signal has been received.
    static void checkpoint();

    // Clears a pending signal. Used by tests.
    static void reset();
    static void raise(int signal);
};
