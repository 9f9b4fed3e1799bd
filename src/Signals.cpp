#include "Signals.h"

namespace {

volatile sig_atomic_t g_pending_signal = 0;

void record_signal(int signal_number) {
    g_pending_signal = signal_number;
}

} // namespace

SignalGuard::SignalGuard() {
    struct sigaction sa {};
    sa.sa_handler = record_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
    sigaction(SIGHUP, &sa, &old_hup_);
}

SignalGuard::~SignalGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
}

int SignalGuard::pending() {
    return g_pending_signal;
}

int SignalGuard::take() {
    int signal_number = g_pending_signal;
    g_pending_signal = 0;
    return signal_number;
}

void SignalGuard::raise_for_test(int signal_number) {
    g_pending_signal = signal_number;
}
