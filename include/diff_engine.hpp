#pragma once
#include <string>
#include <vector>
#include "schema_session.hpp"

/**
 * Ordered statements turning one schema into another, plus the SQL text they
 * came from (written verbatim by the pending workflow).
 *
 * Statements are in dependency order as produced by the diff engine and are
 * never reordered.
 */
class MigrationPlan {
public:
    MigrationPlan() = default;
    MigrationPlan(std::string sql, std::vector<std::string> statements, SQLConnection* target)
        : sql_(std::move(sql))
        , statements_(std::move(statements))
        , target_(target) { }

    const std::string& sql() const { return sql_; }
    const std::vector<std::string>& statements() const { return statements_; }
    bool empty() const { return statements_.empty(); }

    /**
     * @brief Runs every statement, in order, on the "from" connection.
     *
     * All-or-nothing: one transaction; the first failing statement rolls
     * everything back and raises ApplyError. No-op for an empty plan.
     */
    void apply();

private:
    std::string sql_;
    std::vector<std::string> statements_;
    SQLConnection* target_ = nullptr; // owned by the "from" SchemaSession
};

class DiffEngine {
public:
    virtual ~DiffEngine() = default;

    // Everything needed to turn @p from into @p to, destructive statements included.
    // Throws DiffComputationError.
    virtual MigrationPlan diff(SchemaSession& from, SchemaSession& to) = 0;
};
