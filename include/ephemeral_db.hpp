#pragma once
#include <string>
#include <type_traits>
#include <utility>
#include "connection_target.hpp"
#include "connector.hpp"
#include "sqlconnection.hpp"

#define EPHEMERAL_PREFIX     "temp_db"
#define EPHEMERAL_SUFFIX_LEN 10

// EPHEMERAL_PREFIX + EPHEMERAL_SUFFIX_LEN random lowercase letters
std::string ephemeral_name(Random& rnd);
std::string ephemeral_name();

/**
 * @brief Scratch database living exactly as long as this guard.
 *
 * Construction:
 * 1. connects to @p admin (autocommit) through the connector
 * 2. picks a random name and runs CREATE DATABASE with the name quoted as identifier
 *
 * Destruction (or an explicit drop(), whichever comes first, once):
 * 1. REVOKE CONNECT ... FROM PUBLIC so nobody reconnects
 * 2. terminates every other backend still attached to it
 * 3. DROP DATABASE
 * 4. closes the admin connection
 *
 * Teardown errors are logged, never thrown. If CREATE DATABASE fails the
 * constructor throws and there is nothing to tear down.
 */
class EphemeralDatabase {
public:
    EphemeralDatabase(const ResilientConnector& connector, const ConnectionTarget& admin);
    EphemeralDatabase(const ResilientConnector& connector, const ConnectionTarget& admin, std::string name);
    ~EphemeralDatabase() { drop(); }

    EphemeralDatabase(const EphemeralDatabase&) = delete;
    EphemeralDatabase& operator=(const EphemeralDatabase&) = delete;
    EphemeralDatabase(EphemeralDatabase&&) = delete;
    EphemeralDatabase& operator=(EphemeralDatabase&&) = delete;

    const std::string& name() const { return name_; }
    const ConnectionTarget& target() const { return target_; }
    bool dropped() const { return dropped_; }

    void drop() noexcept;

private:
    PSQLConnection admin_;
    std::string name_;
    ConnectionTarget target_;
    bool dropped_ = false;
};

// Runs fn(target) against a fresh scratch database and drops it afterwards, also when fn throws.
template <class F>
auto with_ephemeral_database(const ResilientConnector& connector, const ConnectionTarget& admin, F&& fn)
    -> std::invoke_result_t<F, const ConnectionTarget&> {
    EphemeralDatabase db(connector, admin);
    return std::forward<F>(fn)(db.target());
}
