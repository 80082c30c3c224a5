#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "lib.hpp"

// One result row, NULL columns are std::nullopt.
using SQLRow = std::vector<std::optional<std::string>>;

struct SQLResult {
    std::vector<std::string> columns;
    std::vector<SQLRow> rows;  // filled for SELECT-like statements
    int affected = 0;          // rows affected by INSERT/UPDATE/DELETE
};

class SQLStatement {
public:
    virtual ~SQLStatement() = default;
    // Positional parameters are 1-based and sent as text; the server infers the type.
    virtual void bind(int idx, const std::string& value) = 0;
    virtual void bind_null(int idx) = 0;
    virtual SQLResult exec() = 0;
protected:
    std::string sql_;
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN (Postgres: conninfo string).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    virtual bool connected() const = 0;

    // Executes the whole text as one batch; several ';'-separated statements are allowed.
    // Returns the result of the last statement.
    virtual SQLResult exec(const std::string& sql) = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Quotes a name as an SQL identifier, escaping embedded quotes.
    virtual std::string quote_ident(const std::string& name) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    // autocommit off: the first exec() opens a transaction, commit()/rollback() end it.
    void set_autocommit(bool on) {
        if (on && tr_started_) THROW("set_autocommit: transaction in progress");
        autocommit_ = on;
    }
    bool autocommit() const { return autocommit_; }
    bool in_transaction() const { return tr_started_; }

protected:
    bool tr_started_ = false;
    bool autocommit_ = true;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_postgres_connection();
