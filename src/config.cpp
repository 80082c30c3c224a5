#include "config.hpp"
#include <cstdlib>
#include "errors.hpp"
#include "jsonhlp.hpp"
#include "log.hpp"

namespace {

    // Flat view of the settings while layers are merged.
    struct Settings {
        std::string host = DEFAULT_DB_HOST;
        int port = DEFAULT_DB_PORT;
        std::string user = DEFAULT_DB_USER;
        std::string password = DEFAULT_DB_PASS;
        std::string database = DEFAULT_DB_NAME;
        std::string admin_database;  // empty: same as database
        std::string schema_dir = DEFAULT_SCHEMA_DIR;
        std::string production_dump = DEFAULT_PRODUCTION_DUMP;
        std::string pending_out = DEFAULT_PENDING_OUT;
        MigraOptions migra;
        RetryPolicy retry;
        std::string log_level = DEFAULT_LOG_LEVEL;
    };

    int to_int(const std::string& name, const std::string& value) {
        size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(value, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            THROW_AS(ConfigError, "%s must be an integer, got '%s'", name.c_str(), value.c_str());
        }
        return v;
    }

    bool to_bool(const std::string& name, const std::string& value) {
        const std::string v = lower(trim(value));
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
        THROW_AS(ConfigError, "%s must be a boolean, got '%s'", name.c_str(), value.c_str());
    }

    void apply_file(const std::string& path, Settings& s) {
        jdoc doc;
        std::string err;
        if (!jhlp::parse_file(path, doc, err)) THROW_AS(ConfigError, "%s", err.c_str());
        if (!doc.IsObject()) THROW_AS(ConfigError, "%s: top level must be a JSON object", path.c_str());

        try {
            s.host            = jhlp::get<std::string>(doc, "host", s.host);
            s.port            = jhlp::get<int>(doc, "port", s.port);
            s.user            = jhlp::get<std::string>(doc, "user", s.user);
            s.password        = jhlp::get<std::string>(doc, "password", s.password);
            s.database        = jhlp::get<std::string>(doc, "database", s.database);
            s.admin_database  = jhlp::get<std::string>(doc, "adminDatabase", s.admin_database);
            s.schema_dir      = jhlp::get<std::string>(doc, "schemaDir", s.schema_dir);
            s.production_dump = jhlp::get<std::string>(doc, "productionDump", s.production_dump);
            s.pending_out     = jhlp::get<std::string>(doc, "pendingOut", s.pending_out);
            s.log_level       = jhlp::get<std::string>(doc, "logLevel", s.log_level);

            if (const jval* m = jhlp::object(doc, "migra")) {
                s.migra.executable      = jhlp::get<std::string>(*m, "path", s.migra.executable);
                s.migra.schema          = jhlp::get<std::string>(*m, "schema", s.migra.schema);
                s.migra.with_privileges = jhlp::get<bool>(*m, "withPrivileges", s.migra.with_privileges);
            }
            if (const jval* c = jhlp::object(doc, "connect")) {
                s.retry.max_retries = jhlp::get<int>(*c, "retries", s.retry.max_retries);
                s.retry.delay = std::chrono::milliseconds(
                    jhlp::get<int64_t>(*c, "delayMs", s.retry.delay.count()));
            }
        } catch (const ConfigError&) {
            throw;
        } catch (const std::exception& ex) {
            THROW_AS(ConfigError, "%s: %s", path.c_str(), ex.what());
        }
    }

    void apply_env(const EnvLookup& env, Settings& s) {
        auto str_var = [&](const char* name, std::string& target) {
            if (auto v = env(name)) target = *v;
        };

        str_var(ENV_DB_HOST, s.host);
        if (auto v = env(ENV_DB_PORT)) s.port = to_int(ENV_DB_PORT, *v);
        str_var(ENV_DB_USER, s.user);
        str_var(ENV_DB_PASS, s.password);
        str_var(ENV_DB_NAME, s.database);
        str_var(ENV_DB_ADMIN_NAME, s.admin_database);
        str_var(ENV_SCHEMA_DIR, s.schema_dir);
        str_var(ENV_PRODUCTION_DUMP, s.production_dump);
        str_var(ENV_PENDING_OUT, s.pending_out);
        str_var(ENV_MIGRA_BIN, s.migra.executable);
        str_var(ENV_MIGRA_SCHEMA, s.migra.schema);
        if (auto v = env(ENV_MIGRA_PRIVILEGES)) s.migra.with_privileges = to_bool(ENV_MIGRA_PRIVILEGES, *v);
        if (auto v = env(ENV_CONNECT_RETRIES)) s.retry.max_retries = to_int(ENV_CONNECT_RETRIES, *v);
        if (auto v = env(ENV_CONNECT_DELAY_MS)) s.retry.delay = std::chrono::milliseconds(to_int(ENV_CONNECT_DELAY_MS, *v));
        str_var(ENV_LOG_LEVEL, s.log_level);
    }

    void validate(const Settings& s) {
        if (s.host.empty()) THROW_AS(ConfigError, "database host must not be empty");
        if (s.database.empty()) THROW_AS(ConfigError, "database name must not be empty");
        if (s.port < 1 || s.port > 65535) THROW_AS(ConfigError, "port out of range: %d", s.port);
        if (s.retry.max_retries < 0 || s.retry.max_retries > MAX_CONNECT_RETRIES) {
            THROW_AS(ConfigError, "connect retries must be within 0..%d, got %d", MAX_CONNECT_RETRIES, s.retry.max_retries);
        }
        if (s.retry.delay.count() < 0) THROW_AS(ConfigError, "connect delay must be >= 0");
        if (s.migra.executable.empty()) THROW_AS(ConfigError, "migra executable must not be empty");
        if (!Log::is_level_name(s.log_level)) THROW_AS(ConfigError, "unknown log level '%s'", s.log_level.c_str());
    }
}

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

MigrateConfig load_config(const EnvLookup& env) {
    Settings s;
    auto file = env(ENV_CONFIG_FILE);
    if (file && !file->empty()) apply_file(*file, s);
    apply_env(env, s);
    validate(s);

    return MigrateConfig {
        ConnectionTarget(s.host, s.port, s.user, s.password, s.database),
        s.admin_database.empty() ? s.database : s.admin_database,
        s.schema_dir,
        s.production_dump,
        s.pending_out,
        s.migra,
        s.retry,
        s.log_level,
    };
}
