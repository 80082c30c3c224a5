#include "signals.hpp"
#include <cstring>
#include "errors.hpp"
#include "lib.hpp"

namespace {

    volatile std::sig_atomic_t g_signal = 0;

    void on_signal(int sig) {
        g_signal = sig;
    }
}

InterruptGuard::InterruptGuard() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART
    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
}

bool InterruptGuard::interrupted() {
    return g_signal != 0;
}

void InterruptGuard::check() {
    if (g_signal != 0) {
        int sig = g_signal;
        THROW_AS(Interrupted, "Interrupted by signal %d (%s)", sig, sig == SIGINT ? "SIGINT" : "SIGTERM");
    }
}

void InterruptGuard::raise_for_test(int sig) {
    g_signal = sig;
}

void InterruptGuard::reset() {
    g_signal = 0;
}
