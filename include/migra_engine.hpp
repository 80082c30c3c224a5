#pragma once
#include <string>
#include <vector>
#include "diff_engine.hpp"

struct MigraOptions {
    std::string executable = "migra";  // looked up in PATH unless it contains a '/'
    std::string schema;                // empty: all schemas
    bool with_privileges = false;
};

/**
 * DiffEngine backed by the migra command line tool.
 *
 * Runs `migra --unsafe [--schema S] [--with-privileges] <from-url> <to-url>`.
 * Exit status 0 means no differences, 2 means the SQL on stdout is the
 * migration; anything else is a DiffComputationError carrying stderr.
 */
class MigraDiffEngine final : public DiffEngine {
public:
    explicit MigraDiffEngine(MigraOptions opts = {}) : opts_(std::move(opts)) { }

    MigrationPlan diff(SchemaSession& from, SchemaSession& to) override;

    // Command line arguments (without the executable). When both sides share a
    // password it is left out of the URLs and handed over as PGPASSWORD instead.
    std::vector<std::string> arguments(const ConnectionTarget& from, const ConnectionTarget& to) const;

    static MigrationPlan interpret(int exit_code, const std::string& out, const std::string& err, SQLConnection* target);

    const MigraOptions& options() const { return opts_; }

private:
    static bool shared_password(const ConnectionTarget& from, const ConnectionTarget& to);

    MigraOptions opts_;
};
