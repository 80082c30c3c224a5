#pragma once
#include <csignal>

/**
 * Defers SIGINT/SIGTERM while a workflow runs.
 *
 * The handler only records the signal; the workflow polls check() between
 * stages and unwinds with Interrupted, so scratch databases are still dropped.
 * Handlers are installed without SA_RESTART: a blocking read of the prompt
 * returns early. The previous handlers come back on destruction.
 */
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // Throws Interrupted once a signal has been received.
    static void check();
    static bool interrupted();

    // Test hook: behave as if @p sig had been delivered.
    static void raise_for_test(int sig);
    static void reset();

private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
};
