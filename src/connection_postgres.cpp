// connection_postgres.cpp
#include <libpq-fe.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "lib.hpp"
#include "log.hpp"
#include "sqlconnection.hpp"

namespace {

    // Server NOTICEs ("relation already exists, skipping") go to the log instead of stderr.
    void notice_to_log(void*, const char* message) {
        std::string m = message ? trim(message) : std::string {};
        if (!m.empty()) LOG_DEBUG("postgres: {}", m);
    }

    bool result_ok(ExecStatusType st) {
        return st == PGRES_COMMAND_OK || st == PGRES_TUPLES_OK || st == PGRES_EMPTY_QUERY;
    }

    // Copies a PGresult into an SQLResult; does not clear it.
    SQLResult to_result(PGresult* res) {
        SQLResult out;
        if (PQresultStatus(res) == PGRES_TUPLES_OK) {
            const int cols = PQnfields(res);
            const int rows = PQntuples(res);
            out.columns.reserve(cols);
            for (int c = 0; c < cols; ++c) out.columns.emplace_back(PQfname(res, c));
            out.rows.reserve(rows);
            for (int r = 0; r < rows; ++r) {
                SQLRow row;
                row.reserve(cols);
                for (int c = 0; c < cols; ++c) {
                    if (PQgetisnull(res, r, c)) row.emplace_back(std::nullopt);
                    else row.emplace_back(std::string(PQgetvalue(res, r, c), PQgetlength(res, r, c)));
                }
                out.rows.push_back(std::move(row));
            }
            out.affected = rows;
        } else {
            const char* t = PQcmdTuples(res);
            out.affected = (t && *t) ? std::atoi(t) : 0;
        }
        return out;
    }
}

class PgConnection;

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PgConnection& owner, std::string sql)
        : owner_(owner) { sql_ = std::move(sql); }

    ~PgStatement() override = default;

    void bind(int idx, const std::string& value) override {
        ensure_slot_(idx);
        values_[idx-1] = value;  // own storage
        nulls_[idx-1]  = false;
    }

    void bind_null(int idx) override {
        ensure_slot_(idx);
        values_[idx-1].clear();
        nulls_[idx-1] = true;   // SQL NULL
    }

    SQLResult exec() override;

private:
    void ensure_slot_(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            nulls_.resize(idx, true);
        }
    }

    PgConnection& owner_;
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? trim(PQerrorMessage(conn_)) : "no connection";
            disconnect();
            THROW("Postgres connect failed: %s", err.c_str());
        }
        PQsetNoticeProcessor(conn_, notice_to_log, nullptr);
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    bool connected() const override {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    SQLResult exec(const std::string& sql) override {
        return run(sql, nullptr, nullptr);
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) THROW("prepare: not connected");
        return std::make_unique<PgStatement>(*this, sql);
    }

    std::string quote_ident(const std::string& name) override {
        if (!conn_) THROW("quote_ident: not connected");
        char* q = PQescapeIdentifier(conn_, name.c_str(), name.size());
        if (!q) THROW("quote_ident failed: %s", trim(PQerrorMessage(conn_)).c_str());
        std::string out(q);
        PQfreemem(q);
        return out;
    }

    bool begin() override {
        if (tr_started_) return true;
        tr_started_ = execSQL("BEGIN;");
        return tr_started_;
    }

    bool commit() override {
        if (!tr_started_) return false;
        tr_started_ = false;
        return execSQL("COMMIT;");
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // a broken connection cannot roll back; the server discards the transaction anyway
        if (connected()) execSQL("ROLLBACK;");
    }

    // values/nulls == nullptr: simple query protocol (multi-statement text allowed)
    SQLResult run(const std::string& sql, const std::vector<std::string>* values, const std::vector<bool>* nulls) {
        if (!conn_) THROW("exec: not connected");
        if (!autocommit_ && !tr_started_) begin();

        PGresult* res = nullptr;
        if (values) {
            const int nParams = static_cast<int>(values->size());
            std::vector<const char*> params(nParams, nullptr);
            for (int i = 0; i < nParams; ++i) {
                if (!(*nulls)[i]) params[i] = (*values)[i].c_str();
            }
            res = PQexecParams(
                conn_,
                sql.c_str(),
                nParams,
                nullptr,                               // let server infer types
                (nParams ? params.data() : nullptr),
                nullptr,                               // text params need no lengths
                nullptr,                               // all text format
                0                                      // text results
            );
        } else {
            res = PQexec(conn_, sql.c_str());
        }
        if (!res) THROW("Postgres exec failed: %s", trim(PQerrorMessage(conn_)).c_str());

        if (!result_ok(PQresultStatus(res))) {
            std::string err = trim(PQresultErrorMessage(res));
            PQclear(res);
            THROW("Postgres exec failed: %s", err.c_str());
        }
        SQLResult out = to_result(res);
        PQclear(res);
        return out;
    }

private:
    bool execSQL(const char* sql) {
        if (!conn_) THROW("exec_simple_: not connected");
        PGresult* res = PQexec(conn_, sql);
        if (!res) THROW("Postgres error executing: %s", sql);
        if (PQresultStatus(res) != PGRES_COMMAND_OK) {
            std::string err = trim(PQresultErrorMessage(res));
            PQclear(res);
            THROW("Postgres error: %s", err.c_str());
        }
        PQclear(res);
        return true;
    }

    PGconn* conn_ = nullptr;
};

SQLResult PgStatement::exec() {
    return owner_.run(sql_, &values_, &nulls_);
}

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
