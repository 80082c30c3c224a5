#include "ephemeral_db.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace {

    const char* KILL_OTHER_BACKENDS =
        "SELECT pg_terminate_backend(pg_stat_activity.pid) "
        "FROM pg_stat_activity "
        "WHERE pg_stat_activity.datname = $1 "
        "AND pid <> pg_backend_pid();";

}

std::string ephemeral_name(Random& rnd) {
    return EPHEMERAL_PREFIX + rnd.letters(EPHEMERAL_SUFFIX_LEN);
}

std::string ephemeral_name() {
    thread_local Random rnd;
    return ephemeral_name(rnd);
}

EphemeralDatabase::EphemeralDatabase(const ResilientConnector& connector, const ConnectionTarget& admin)
    : EphemeralDatabase(connector, admin, ephemeral_name()) { }

EphemeralDatabase::EphemeralDatabase(const ResilientConnector& connector, const ConnectionTarget& admin, std::string name)
    : admin_(connector.connect(admin))
    , name_(std::move(name))
    , target_(admin.with_database(name_)) {
    admin_->set_autocommit(true);
    try {
        admin_->exec("CREATE DATABASE " + admin_->quote_ident(name_) + ";");
    } catch (const std::exception& ex) {
        dropped_ = true; // nothing was created
        admin_->disconnect();
        THROW_AS(MigrateError, "Could not create temporary database %s: %s", name_.c_str(), ex.what());
    }
    LOG_INFO("Created temporary database {}", name_);
}

void EphemeralDatabase::drop() noexcept {
    if (dropped_) return;
    dropped_ = true;

    try {
        const std::string ident = admin_->quote_ident(name_);

        try {
            admin_->exec("REVOKE CONNECT ON DATABASE " + ident + " FROM PUBLIC;");
        } catch (const std::exception& ex) {
            LOG_ERROR("Revoking connect on {} failed: {}", name_, ex.what());
        }

        try {
            auto stmt = admin_->prepare(KILL_OTHER_BACKENDS);
            stmt->bind(1, name_);
            SQLResult r = stmt->exec();
            if (!r.rows.empty()) LOG_DEBUG("Terminated {} backend(s) on {}", r.rows.size(), name_);
        } catch (const std::exception& ex) {
            LOG_ERROR("Terminating connections to {} failed: {}", name_, ex.what());
        }

        admin_->exec("DROP DATABASE " + ident + ";");
        LOG_INFO("Dropped temporary database {}", name_);
    } catch (const std::exception& ex) {
        LOG_ERROR("Dropping temporary database {} failed, remove it manually: {}", name_, ex.what());
    }

    admin_->disconnect();
}
