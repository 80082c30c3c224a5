#include "schema_session.hpp"
#include "log.hpp"

void SchemaSession::close() noexcept {
    if (!conn_) return;
    try {
        if (conn_->in_transaction()) conn_->rollback();
    } catch (const std::exception& ex) {
        LOG_WARN("Rollback on close of {} failed: {}", target_.dbname(), ex.what());
    }
    conn_->disconnect();
}
