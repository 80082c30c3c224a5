#pragma once
#include <stdexcept>
#include <string>

/**
 * Error taxonomy of the migration workflows.
 *
 * Driver code (PgConnection, PgStatement) throws plain std::runtime_error via THROW;
 * the components translate those into one of the types below so main() and the
 * tests can tell which stage failed.
 */
class MigrateError : public std::runtime_error {
public:
    explicit MigrateError(const std::string& msg) : std::runtime_error(msg) {}
};

// All connection attempts failed.
class ConnectionError : public MigrateError {
public:
    explicit ConnectionError(const std::string& msg) : MigrateError(msg) {}
};

// A schema file could not be read or executed.
class SchemaLoadError : public MigrateError {
public:
    explicit SchemaLoadError(const std::string& msg) : MigrateError(msg) {}
};

// The external diff engine failed.
class DiffComputationError : public MigrateError {
public:
    explicit DiffComputationError(const std::string& msg) : MigrateError(msg) {}
};

// A generated statement failed against the target database.
class ApplyError : public MigrateError {
public:
    explicit ApplyError(const std::string& msg) : MigrateError(msg) {}
};

class ConfigError : public MigrateError {
public:
    explicit ConfigError(const std::string& msg) : MigrateError(msg) {}
};

// SIGINT/SIGTERM received while a workflow was running.
class Interrupted : public MigrateError {
public:
    explicit Interrupted(const std::string& msg) : MigrateError(msg) {}
};
