#pragma once
#include "connection_target.hpp"
#include "connector.hpp"
#include "sqlconnection.hpp"

/**
 * An open connection bound to one database, used as the "from" or "to" side of a diff.
 * The connection is closed when the session goes out of scope.
 */
class SchemaSession {
public:
    SchemaSession(const ResilientConnector& connector, ConnectionTarget target)
        : target_(std::move(target))
        , conn_(connector.connect(target_)) { }

    SchemaSession(ConnectionTarget target, PSQLConnection conn)
        : target_(std::move(target))
        , conn_(std::move(conn)) {
        if (!conn_) THROW("SchemaSession: null connection");
    }

    ~SchemaSession() { close(); }

    SchemaSession(const SchemaSession&) = delete;
    SchemaSession& operator=(const SchemaSession&) = delete;

    const ConnectionTarget& target() const { return target_; }
    SQLConnection& conn() const { return *conn_; }

    // Rolls back an unfinished transaction. Safe to call multiple times.
    void close() noexcept;

private:
    ConnectionTarget target_;
    PSQLConnection conn_;
};
