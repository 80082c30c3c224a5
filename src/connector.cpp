#include "connector.hpp"
#include <algorithm>
#include <thread>
#include "errors.hpp"
#include "log.hpp"
#include "signals.hpp"

ResilientConnector::ResilientConnector(RetryPolicy policy, Factory factory, Sleeper sleeper)
    : policy_(policy)
    , factory_(std::move(factory))
    , sleeper_(std::move(sleeper)) {
    if (!factory_) THROW("ResilientConnector: null connection factory");
    if (!sleeper_) sleeper_ = default_sleep;
    if (policy_.max_retries < 0) policy_.max_retries = 0;
    if (policy_.max_retries > MAX_CONNECT_RETRIES) policy_.max_retries = MAX_CONNECT_RETRIES;
}

// Sleeps in short slices so a pending SIGINT/SIGTERM cuts the wait short.
void ResilientConnector::default_sleep(std::chrono::milliseconds d) {
    const auto slice = std::chrono::milliseconds(50);
    const auto until = std::chrono::steady_clock::now() + d;
    while (!InterruptGuard::interrupted()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, until - now));
    }
}

PSQLConnection ResilientConnector::connect(const ConnectionTarget& target) const {
    LOG_INFO("Attempting to connect to database at {}", target.redacted_url());

    std::string last_error;
    const int attempts = policy_.max_retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        InterruptGuard::check();
        PSQLConnection conn = factory_();
        if (!conn) THROW_AS(ConnectionError, "connection factory returned null");
        try {
            conn->connect(target.conninfo());
            if (attempt > 1) LOG_INFO("Connected to {} after {} attempt(s)", target.redacted_url(), attempt);
            return conn;
        } catch (const std::exception& ex) {
            last_error = ex.what();
        }

        if (attempt == attempts) break;
        LOG_WARN("Connection failed ({} time(s)): {}; retrying again in {} ms...",
            attempt, last_error, policy_.delay.count());
        sleeper_(policy_.delay);
    }

    LOG_ERROR("Giving up on {} after {} attempt(s)", target.redacted_url(), attempts);
    THROW_AS(ConnectionError, "Max number of connection attempts has been reached (%d): %s",
        policy_.max_retries, last_error.c_str());
}
