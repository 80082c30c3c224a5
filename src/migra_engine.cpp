#include "migra_engine.hpp"
#include <future>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include "errors.hpp"
#include "log.hpp"
#include "sql_splitter.hpp"

namespace bp = boost::process;

namespace {

    const int MIGRA_NO_CHANGES = 0;
    const int MIGRA_CHANGES    = 2;

    struct ProcessResult {
        int exit_code = -1;
        std::string out;
        std::string err;
    };

    ProcessResult run_process(const std::string& executable, const std::vector<std::string>& args, const std::string& password) {
        boost::filesystem::path exe = executable;
        if (executable.find('/') == std::string::npos) exe = bp::search_path(executable);
        if (exe.empty()) THROW_AS(DiffComputationError, "Diff engine '%s' not found in PATH", executable.c_str());

        bp::environment env = boost::this_process::environment();
        if (!password.empty()) env["PGPASSWORD"] = password;

        boost::asio::io_context ios;
        std::future<std::string> out;
        std::future<std::string> err;
        ProcessResult r;
        try {
            bp::child c(exe, bp::args(args), env, bp::std_in.close(), bp::std_out > out, bp::std_err > err, ios);
            ios.run();
            c.wait();
            r.exit_code = c.exit_code();
            r.out = out.get();
            r.err = err.get();
        } catch (const std::exception& ex) {
            THROW_AS(DiffComputationError, "Running %s failed: %s", exe.string().c_str(), ex.what());
        }
        return r;
    }
}

bool MigraDiffEngine::shared_password(const ConnectionTarget& from, const ConnectionTarget& to) {
    return !from.password().empty() && from.password() == to.password();
}

std::vector<std::string> MigraDiffEngine::arguments(const ConnectionTarget& from, const ConnectionTarget& to) const {
    std::vector<std::string> args { "--unsafe" };
    if (!opts_.schema.empty()) {
        args.push_back("--schema");
        args.push_back(opts_.schema);
    }
    if (opts_.with_privileges) args.push_back("--with-privileges");

    bool env_pw = shared_password(from, to);
    args.push_back(from.url(!env_pw));
    args.push_back(to.url(!env_pw));
    return args;
}

MigrationPlan MigraDiffEngine::interpret(int exit_code, const std::string& out, const std::string& err, SQLConnection* target) {
    if (exit_code == MIGRA_NO_CHANGES) return MigrationPlan("", {}, target);

    if (exit_code == MIGRA_CHANGES) {
        auto statements = split_statements(out);
        if (statements.empty()) {
            THROW_AS(DiffComputationError, "Diff engine reported changes but produced no SQL: %s", trim(err).c_str());
        }
        return MigrationPlan(out, std::move(statements), target);
    }

    std::string detail = trim(err);
    if (detail.empty()) detail = trim(out);
    THROW_AS(DiffComputationError, "Diff engine failed with exit code %d: %s", exit_code, detail.c_str());
}

MigrationPlan MigraDiffEngine::diff(SchemaSession& from, SchemaSession& to) {
    LOG_INFO("Computing schema diff {} -> {}", from.target().redacted_url(), to.target().redacted_url());
    const std::string pw = shared_password(from.target(), to.target()) ? from.target().password() : "";
    ProcessResult r = run_process(opts_.executable, arguments(from.target(), to.target()), pw);
    if (!trim(r.err).empty()) LOG_DEBUG("{} stderr: {}", opts_.executable, trim(r.err));

    MigrationPlan plan = interpret(r.exit_code, r.out, r.err, &from.conn());
    LOG_INFO("Diff produced {} statement(s)", plan.statements().size());
    return plan;
}
