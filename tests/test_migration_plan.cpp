#include <catch2/catch.hpp>
#include "errors.hpp"
#include "fake_sql.hpp"

namespace {
    const ConnectionTarget DEV("localhost", 5432, "test", "pass", "dev");
}

TEST_CASE("apply runs every statement in order inside one transaction", "[plan]") {
    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    MigrationPlan plan("...", { "CREATE TABLE a (id integer);", "CREATE TABLE b (id integer);" }, &session.conn());
    REQUIRE_FALSE(plan.empty());
    plan.apply();

    REQUIRE(cluster.log == std::vector<std::string> {
        "dev: BEGIN;",
        "dev: CREATE TABLE a (id integer);",
        "dev: CREATE TABLE b (id integer);",
        "dev: COMMIT;",
    });
    REQUIRE(cluster.has_table("dev", "a"));
    REQUIRE(cluster.has_table("dev", "b"));
    REQUIRE_FALSE(session.conn().in_transaction());
}

TEST_CASE("a failing statement rolls everything back", "[plan]") {
    FakeCluster cluster;
    cluster.fail_on = { "CREATE TABLE b" };
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    MigrationPlan plan("...", {
        "CREATE TABLE a (id integer);",
        "CREATE TABLE b (id integer);",
        "CREATE TABLE c (id integer);",
    }, &session.conn());

    REQUIRE_THROWS_WITH(plan.apply(), Catch::Contains("Statement 2 of 3") && Catch::Contains("CREATE TABLE b"));
    REQUIRE_FALSE(cluster.has_table("dev", "a"));
    REQUIRE(cluster.count("ROLLBACK;") == 1);
    REQUIRE(cluster.count("CREATE TABLE c") == 0);
    REQUIRE(cluster.count("COMMIT;") == 0);
}

TEST_CASE("apply failure is an ApplyError", "[plan]") {
    FakeCluster cluster;
    cluster.fail_on = { "DROP TABLE" };
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    MigrationPlan plan("DROP TABLE x;", { "DROP TABLE x;" }, &session.conn());
    REQUIRE_THROWS_AS(plan.apply(), ApplyError);
}

TEST_CASE("an empty plan applies nothing", "[plan]") {
    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    MigrationPlan plan("", {}, &session.conn());
    REQUIRE(plan.empty());
    REQUIRE_NOTHROW(plan.apply());
    REQUIRE(cluster.log.empty());

    MigrationPlan unbound;
    REQUIRE_NOTHROW(unbound.apply());
}

TEST_CASE("session close rolls back an open transaction", "[plan]") {
    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    {
        SchemaSession session(connector, DEV);
        session.conn().begin();
        session.conn().exec("CREATE TABLE a (id integer);");
        REQUIRE(cluster.has_table("dev", "a"));
    }
    REQUIRE_FALSE(cluster.has_table("dev", "a"));
    REQUIRE(cluster.open_connections == 0);
}
