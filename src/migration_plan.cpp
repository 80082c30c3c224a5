#include "diff_engine.hpp"
#include "errors.hpp"
#include "log.hpp"

void MigrationPlan::apply() {
    if (statements_.empty()) return;
    if (!target_) THROW_AS(ApplyError, "apply: plan is not bound to a connection");

    SQLConnection& conn = *target_;
    try {
        if (!conn.begin()) THROW("begin() failed");
    } catch (const std::exception& ex) {
        THROW_AS(ApplyError, "Could not start migration transaction: %s", ex.what());
    }

    size_t idx = 0;
    try {
        for (const auto& stmt : statements_) {
            ++idx;
            LOG_DEBUG("Applying statement {}/{}: {}", idx, statements_.size(), stmt);
            conn.exec(stmt);
        }
    } catch (const std::exception& ex) {
        try {
            conn.rollback();
        } catch (const std::exception& rb) {
            LOG_ERROR("Rollback failed: {}", rb.what());
        }
        THROW_AS(ApplyError, "Statement %zu of %zu failed, no changes were applied: %s\n%s",
            idx, statements_.size(), ex.what(), statements_[idx - 1].c_str());
    }

    try {
        if (!conn.commit()) THROW("commit() failed");
    } catch (const std::exception& ex) {
        THROW_AS(ApplyError, "Committing the migration failed: %s", ex.what());
    }
    LOG_INFO("Applied {} statement(s)", statements_.size());
}
