#include <catch2/catch.hpp>
#include <climits>
#include <csignal>
#include <vector>
#include "errors.hpp"
#include "fake_sql.hpp"
#include "signals.hpp"

using namespace std::chrono_literals;

namespace {
    const ConnectionTarget DEV("localhost", 5432, "test", "pass", "dev");

    ResilientConnector recording_connector(FakeCluster& cluster, std::vector<std::chrono::milliseconds>& sleeps,
        RetryPolicy policy = {}) {
        return ResilientConnector(policy,
            [&cluster]() -> PSQLConnection { return std::make_unique<FakeSQLConnection>(cluster); },
            [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
}

TEST_CASE("default policy is 12 retries, 5 seconds apart", "[connector]") {
    RetryPolicy p;
    REQUIRE(p.max_retries == 12);
    REQUIRE(p.delay == 5000ms);
}

TEST_CASE("first attempt succeeds without waiting", "[connector]") {
    FakeCluster cluster;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps);

    PSQLConnection conn = connector.connect(DEV);
    REQUIRE(conn);
    REQUIRE(conn->connected());
    REQUIRE(cluster.connect_calls == 1);
    REQUIRE(sleeps.empty());
}

TEST_CASE("transient failures are retried with a fixed delay", "[connector]") {
    FakeCluster cluster;
    cluster.connect_failures = 3;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps);

    PSQLConnection conn = connector.connect(DEV);
    REQUIRE(conn->connected());
    REQUIRE(cluster.connect_calls == 4);
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>(3, 5000ms));
}

TEST_CASE("gives up after 13 attempts", "[connector]") {
    FakeCluster cluster;
    cluster.connect_failures = 100;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps);

    REQUIRE_THROWS_AS(connector.connect(DEV), ConnectionError);
    REQUIRE(cluster.connect_calls == 13);
    REQUIRE(sleeps.size() == 12);
}

TEST_CASE("twelfth retry may still succeed", "[connector]") {
    FakeCluster cluster;
    cluster.connect_failures = 12;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps);

    REQUIRE_NOTHROW(connector.connect(DEV));
    REQUIRE(cluster.connect_calls == 13);
}

TEST_CASE("zero retries means a single attempt", "[connector]") {
    FakeCluster cluster;
    cluster.connect_failures = 1;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps, RetryPolicy { 0, 10ms });

    REQUIRE_THROWS_AS(connector.connect(DEV), ConnectionError);
    REQUIRE(cluster.connect_calls == 1);
    REQUIRE(sleeps.empty());
}

TEST_CASE("error message names the last failure", "[connector]") {
    FakeCluster cluster;
    auto connector = fake_connector(cluster, 2);
    REQUIRE_THROWS_WITH(connector.connect(DEV.with_database("missing")),
        Catch::Contains("database \"missing\" does not exist") && Catch::Contains("(2)"));
    REQUIRE(cluster.connect_calls == 3);
}

TEST_CASE("retry count is capped", "[connector]") {
    FakeCluster cluster;
    std::vector<std::chrono::milliseconds> sleeps;
    auto connector = recording_connector(cluster, sleeps, RetryPolicy { INT_MAX, 0ms });
    REQUIRE(connector.policy().max_retries == MAX_CONNECT_RETRIES);
}

TEST_CASE("an interrupt between attempts ends the retry loop", "[connector][signals]") {
    InterruptGuard::reset();
    FakeCluster cluster;
    cluster.connect_failures = 100;
    int waits = 0;
    ResilientConnector connector(RetryPolicy { 12, 200ms },
        [&cluster]() -> PSQLConnection { return std::make_unique<FakeSQLConnection>(cluster); },
        [&waits](std::chrono::milliseconds) {
            if (++waits == 2) InterruptGuard::raise_for_test(SIGINT);
        });

    REQUIRE_THROWS_AS(connector.connect(DEV), Interrupted);
    InterruptGuard::reset();
    REQUIRE(cluster.connect_calls == 2);
    REQUIRE(waits == 2);
}

TEST_CASE("default sleep is cut short by an interrupt", "[connector][signals]") {
    InterruptGuard::reset();
    InterruptGuard::raise_for_test(SIGTERM);
    const auto t0 = std::chrono::steady_clock::now();
    ResilientConnector::default_sleep(5000ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    InterruptGuard::reset();
    REQUIRE(elapsed < 1000ms);
}

TEST_CASE("default sleep waits the full delay otherwise", "[connector]") {
    InterruptGuard::reset();
    const auto t0 = std::chrono::steady_clock::now();
    ResilientConnector::default_sleep(120ms);
    REQUIRE(std::chrono::steady_clock::now() - t0 >= 120ms);
}
