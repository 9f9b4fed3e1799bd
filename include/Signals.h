#ifndef SIGNALS_H
#define SIGNALS_H

#include <signal.h>

/**
 * @class SignalGuard
 * @brief Records SIGINT, SIGTERM and SIGHUP for the lifetime of the session.
 *
 * The handler only stores the signal number. Handlers are installed
 * without SA_RESTART so a blocking waitpid() returns EINTR and the caller
 * can react. The previous dispositions are restored on destruction.
 */
class SignalGuard {
public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    // Last signal received and not yet consumed, or 0.
    static int pending();

    // Returns pending() and resets it.
    static int take();

    // Records a signal as if it had been delivered; used by tests.
    static void raise_for_test(int signal_number);

private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
    struct sigaction old_hup_ {};
};

#endif // SIGNALS_H
