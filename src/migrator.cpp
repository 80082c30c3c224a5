#include "migrator.hpp"
#include <fstream>
#include "ephemeral_db.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "signals.hpp"

#define MSG_ALREADY_SYNCED  "Already synced."
#define MSG_PENDING_HEADER  "THE FOLLOWING CHANGES ARE PENDING:"
#define MSG_CONFIRM         "Apply these changes?"
#define MSG_APPLYING        "Applying..."
#define MSG_APPLIED         "Changes applied."
#define MSG_NOT_APPLYING    "Not applying."
#define MSG_NOTHING_PENDING "No changes needed, setting pending.sql to empty."

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Start:             return "START";
        case Stage::EphemeralAcquired: return "EPHEMERAL_ACQUIRED";
        case Stage::SchemasLoaded:     return "SCHEMAS_LOADED";
        case Stage::DiffComputed:      return "DIFF_COMPUTED";
        case Stage::Applied:           return "APPLIED";
        case Stage::Written:           return "WRITTEN";
        case Stage::Skipped:           return "SKIPPED";
        case Stage::EphemeralReleased: return "EPHEMERAL_RELEASED";
        case Stage::Done:              return "DONE";
        case Stage::Failed:            return "FAILED";
    }
    return "?";
}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::AlreadySynced: return "already synced";
        case Outcome::Applied:       return "applied";
        case Outcome::Declined:      return "declined";
        case Outcome::Written:       return "written";
    }
    return "?";
}

void write_text_file(const std::filesystem::path& file, const std::string& text) {
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) THROW_AS(MigrateError, "Cannot create directory %s: %s",
            file.parent_path().string().c_str(), ec.message().c_str());
    }
    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f) THROW_AS(MigrateError, "Cannot open %s for writing", file.string().c_str());
    f << text;
    f.flush();
    if (!f) THROW_AS(MigrateError, "Writing %s failed", file.string().c_str());
}

Migrator::Migrator(MigrateConfig cfg, const ResilientConnector& connector, DiffEngine& engine,
    Prompt& prompt, std::ostream& out, SchemaLoader loader)
    : cfg_(std::move(cfg))
    , connector_(connector)
    , engine_(engine)
    , prompt_(prompt)
    , out_(out)
    , loader_(std::move(loader)) { }

void Migrator::enter(Stage stage) {
    LOG_DEBUG("stage {} -> {}", stage_name(stage_), stage_name(stage));
    stage_ = stage;
}

void Migrator::print_pending(const MigrationPlan& plan) {
    out_ << '\n' << MSG_PENDING_HEADER << "\n\n" << plan.sql();
    if (plan.sql().empty() || plan.sql().back() != '\n') out_ << '\n';
    out_ << std::flush;
}

/*=============================  sync  =============================*/
Outcome Migrator::sync(bool no_prompt) {
    InterruptGuard guard;
    stage_ = Stage::Start;
    try {
        Outcome res = run_sync(no_prompt);  // scratch database dropped on return
        enter(Stage::EphemeralReleased);
        enter(Stage::Done);
        LOG_INFO("sync finished: {}", outcome_name(res));
        return res;
    } catch (...) {
        enter(Stage::EphemeralReleased);
        enter(Stage::Failed);
        throw;
    }
}

Outcome Migrator::run_sync(bool no_prompt) {
    InterruptGuard::check();
    EphemeralDatabase temp(connector_, cfg_.admin());
    enter(Stage::EphemeralAcquired);

    LOG_INFO("live database: {}", cfg_.live.redacted_url());
    LOG_INFO("temp database: {}", temp.target().redacted_url());

    SchemaSession from(connector_, cfg_.live);
    SchemaSession target(connector_, temp.target());
    InterruptGuard::check();

    loader_.load_from_folder(target, cfg_.schema_dir);
    enter(Stage::SchemasLoaded);
    InterruptGuard::check();

    MigrationPlan plan = engine_.diff(from, target);
    enter(Stage::DiffComputed);
    InterruptGuard::check();

    if (plan.empty()) {
        out_ << MSG_ALREADY_SYNCED << std::endl;
        enter(Stage::Skipped);
        return Outcome::AlreadySynced;
    }

    print_pending(plan);
    const bool go = no_prompt || prompt_.confirm(MSG_CONFIRM);
    InterruptGuard::check();  // a signal during the prompt reads as "no" answer
    if (!go) {
        out_ << MSG_NOT_APPLYING << std::endl;
        enter(Stage::Skipped);
        return Outcome::Declined;
    }

    out_ << MSG_APPLYING << std::endl;
    plan.apply();
    out_ << MSG_APPLIED << std::endl;
    enter(Stage::Applied);
    return Outcome::Applied;
}

/*=============================  pending  =============================*/
Outcome Migrator::pending() {
    InterruptGuard guard;
    stage_ = Stage::Start;
    try {
        Outcome res = run_pending();
        enter(Stage::EphemeralReleased);
        enter(Stage::Done);
        LOG_INFO("pending finished: {}", outcome_name(res));
        return res;
    } catch (...) {
        enter(Stage::EphemeralReleased);
        enter(Stage::Failed);
        throw;
    }
}

Outcome Migrator::run_pending() {
    InterruptGuard::check();
    const ConnectionTarget admin = cfg_.admin();
    EphemeralDatabase prod(connector_, admin);
    EphemeralDatabase wanted(connector_, admin);
    enter(Stage::EphemeralAcquired);

    LOG_INFO("production replica: {}", prod.target().redacted_url());
    LOG_INFO("target schema: {}", wanted.target().redacted_url());

    SchemaSession from(connector_, prod.target());
    SchemaSession to(connector_, wanted.target());
    InterruptGuard::check();

    loader_.load_from_file(from, cfg_.production_dump);
    InterruptGuard::check();
    loader_.load_from_folder(to, cfg_.schema_dir);
    enter(Stage::SchemasLoaded);
    InterruptGuard::check();

    MigrationPlan plan = engine_.diff(from, to);
    enter(Stage::DiffComputed);
    InterruptGuard::check();

    if (plan.empty()) {
        out_ << MSG_NOTHING_PENDING << std::endl;
        write_text_file(cfg_.pending_out, "");
    } else {
        print_pending(plan);
        write_text_file(cfg_.pending_out, plan.sql());
    }
    out_ << "Changes written to " << cfg_.pending_out.string() << "." << std::endl;
    enter(Stage::Written);
    return Outcome::Written;
}
