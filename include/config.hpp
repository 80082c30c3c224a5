#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "connection_target.hpp"
#include "connector.hpp"
#include "migra_engine.hpp"

/****************** DEFAULTS */
#define DEFAULT_DB_HOST          "localhost"
#define DEFAULT_DB_PORT          5432
#define DEFAULT_DB_USER          "test"
#define DEFAULT_DB_PASS          "pass"
#define DEFAULT_DB_NAME          "dev"
#define DEFAULT_SCHEMA_DIR       "src/models"
#define DEFAULT_PRODUCTION_DUMP  "migrations/production.dump.sql"
#define DEFAULT_PENDING_OUT      "migrations/pending.sql"
#define DEFAULT_LOG_LEVEL        "info"

/****************** ENVIRONMENT */
#define ENV_CONFIG_FILE      "SCHEMASYNC_CONFIG"
#define ENV_DB_HOST          "DB_HOST"
#define ENV_DB_PORT          "DB_PORT"
#define ENV_DB_USER          "DB_USER"
#define ENV_DB_PASS          "DB_PASS"
#define ENV_DB_NAME          "DB_NAME"
#define ENV_DB_ADMIN_NAME    "DB_ADMIN_NAME"
#define ENV_SCHEMA_DIR       "SCHEMA_DIR"
#define ENV_PRODUCTION_DUMP  "PRODUCTION_DUMP"
#define ENV_PENDING_OUT      "PENDING_OUT"
#define ENV_MIGRA_BIN        "MIGRA_BIN"
#define ENV_MIGRA_SCHEMA     "MIGRA_SCHEMA"
#define ENV_MIGRA_PRIVILEGES "MIGRA_PRIVILEGES"
#define ENV_CONNECT_RETRIES  "CONNECT_RETRIES"
#define ENV_CONNECT_DELAY_MS "CONNECT_DELAY_MS"
#define ENV_LOG_LEVEL        "LOG_LEVEL"

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// std::getenv wrapper; std::nullopt only when unset, a set-but-empty variable is "".
std::optional<std::string> process_env(const std::string& name);

/**
 * Everything a run needs, resolved once at start-up and passed down as const.
 */
struct MigrateConfig {
    ConnectionTarget live;          // the database sync reconciles
    std::string admin_database;     // where CREATE/DROP DATABASE for scratch databases run
    std::filesystem::path schema_dir;
    std::filesystem::path production_dump;
    std::filesystem::path pending_out;
    MigraOptions migra;
    RetryPolicy retry;
    std::string log_level;

    ConnectionTarget admin() const { return live.with_database(admin_database); }
};

/**
 * @brief Resolves the configuration.
 *
 * Precedence, lowest first:
 * 1. built-in defaults (DEFAULT_*)
 * 2. the JSON file named by SCHEMASYNC_CONFIG, if set
 * 3. environment variables (ENV_*)
 *
 * @throws ConfigError for an unreadable file or an invalid value
 */
MigrateConfig load_config(const EnvLookup& env = process_env);
