#include <catch2/catch.hpp>
#include "errors.hpp"
#include "fake_sql.hpp"
#include "schema_loader.hpp"
#include "temp_dir.hpp"

namespace {
    const ConnectionTarget DEV("localhost", 5432, "test", "pass", "dev");
}

TEST_CASE("folder files load recursively in lexicographic order", "[loader]") {
    TempDir dir;
    dir.write("b.sql", "CREATE TABLE b (id integer);");
    dir.write("a.sql", "CREATE TABLE a (id integer);");
    dir.write("sub/c.sql", "CREATE TABLE c (id integer);");
    dir.write("notes.txt", "CREATE TABLE nope (id integer);");

    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);
    SchemaLoader().load_from_folder(session, dir.path);

    REQUIRE(cluster.log.size() == 3);
    REQUIRE(cluster.log[0] == "dev: CREATE TABLE a (id integer);");
    REQUIRE(cluster.log[1] == "dev: CREATE TABLE b (id integer);");
    REQUIRE(cluster.log[2] == "dev: CREATE TABLE c (id integer);");
    REQUIRE_FALSE(cluster.has_table("dev", "nope"));
}

TEST_CASE("ordering is by path string, not numeric", "[loader]") {
    TempDir dir;
    dir.write("2_users.sql", "");
    dir.write("10_orders.sql", "");
    dir.write("1_base.sql", "");

    auto files = SchemaLoader::discover(dir.path);
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].filename().string() == "10_orders.sql");
    REQUIRE(files[1].filename().string() == "1_base.sql");
    REQUIRE(files[2].filename().string() == "2_users.sql");
}

TEST_CASE("an empty folder or empty file is a no-op", "[loader]") {
    TempDir dir;
    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    SchemaLoader loader;
    REQUIRE_NOTHROW(loader.load_from_folder(session, dir.path));
    auto empty = dir.write("empty.sql", "  \n\n");
    REQUIRE_NOTHROW(loader.load_from_file(session, empty));
    REQUIRE(cluster.log.empty());
}

TEST_CASE("a file is sent as one batch", "[loader]") {
    TempDir dir;
    auto dump = dir.write("dump.sql", "CREATE TABLE a (id integer);\nCREATE TABLE b (id integer);\n");

    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);
    SchemaLoader().load_from_file(session, dump);

    REQUIRE(cluster.log.size() == 1);
    REQUIRE(cluster.has_table("dev", "a"));
    REQUIRE(cluster.has_table("dev", "b"));
}

TEST_CASE("missing inputs raise SchemaLoadError", "[loader]") {
    TempDir dir;
    FakeCluster cluster;
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);
    SchemaLoader loader;

    REQUIRE_THROWS_AS(loader.load_from_folder(session, dir.path / "nope"), SchemaLoadError);
    REQUIRE_THROWS_AS(loader.load_from_file(session, dir.path / "nope.sql"), SchemaLoadError);
    REQUIRE_THROWS_AS(loader.load_from_file(session, dir.path), SchemaLoadError);
}

TEST_CASE("a failing file stops the load and names the file", "[loader]") {
    TempDir dir;
    dir.write("a.sql", "CREATE TABLE a (id integer);");
    dir.write("b.sql", "CREATE TABLE b (id integer);");
    dir.write("c.sql", "CREATE TABLE c (id integer);");

    FakeCluster cluster;
    cluster.fail_on = { "CREATE TABLE b" };
    auto connector = fake_connector(cluster);
    SchemaSession session(connector, DEV);

    try {
        SchemaLoader().load_from_folder(session, dir.path);
        FAIL("expected SchemaLoadError");
    } catch (const SchemaLoadError& ex) {
        REQUIRE(std::string(ex.what()).find("b.sql") != std::string::npos);
    }
    REQUIRE(cluster.has_table("dev", "a"));
    REQUIRE_FALSE(cluster.has_table("dev", "c"));
}
