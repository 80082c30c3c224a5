#pragma once
#include <chrono>
#include <functional>
#include "connection_target.hpp"
#include "sqlconnection.hpp"

#define MAX_CONNECT_RETRIES 1000

struct RetryPolicy {
    int max_retries { 12 };                        // retries after the first attempt
    std::chrono::milliseconds delay { 5000 };      // fixed wait between attempts
};

/**
 * Opens connections, retrying while the server is unreachable (container still
 * starting, failover...).
 *
 * connect() makes at most 1 + max_retries attempts and then throws ConnectionError.
 * It keeps no state between calls, so one connector may serve several targets.
 * A pending interrupt (InterruptGuard) ends the loop with Interrupted.
 */
class ResilientConnector {
public:
    using Factory = std::function<PSQLConnection()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit ResilientConnector(RetryPolicy policy = {},
        Factory factory = make_postgres_connection,
        Sleeper sleeper = default_sleep);

    PSQLConnection connect(const ConnectionTarget& target) const;

    const RetryPolicy& policy() const { return policy_; }

    static void default_sleep(std::chrono::milliseconds d);

private:
    RetryPolicy policy_;
    Factory factory_;
    Sleeper sleeper_;
};
