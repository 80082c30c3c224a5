#pragma once
#include <iostream>
#include "config.hpp"
#include "connector.hpp"
#include "diff_engine.hpp"
#include "prompt.hpp"
#include "schema_loader.hpp"

enum class Outcome { AlreadySynced, Applied, Declined, Written };

// START -> EPHEMERAL_ACQUIRED -> SCHEMAS_LOADED -> DIFF_COMPUTED -> (APPLIED|WRITTEN|SKIPPED)
//       -> EPHEMERAL_RELEASED -> DONE; any failure -> EPHEMERAL_RELEASED -> FAILED
enum class Stage { Start, EphemeralAcquired, SchemasLoaded, DiffComputed, Applied, Written, Skipped, EphemeralReleased, Done, Failed };

const char* stage_name(Stage stage);
const char* outcome_name(Outcome outcome);

/**
 * The two migration workflows.
 *
 * Both are synchronous and strictly sequential; scratch databases are owned by
 * the running call and dropped before it returns or throws. Operator-facing
 * text goes to @p out, diagnostics to the log.
 */
class Migrator {
public:
    Migrator(MigrateConfig cfg, const ResilientConnector& connector, DiffEngine& engine,
        Prompt& prompt, std::ostream& out, SchemaLoader loader = {});

    /**
     * @brief Reconciles the live database with the application schema.
     *
     * 1. creates a scratch database and loads cfg.schema_dir into it
     * 2. diffs live -> scratch
     * 3. nothing to do: "Already synced."
     * 4. otherwise prints the SQL, asks for confirmation unless @p no_prompt,
     *    and applies it to the live database on "y"
     */
    Outcome sync(bool no_prompt);

    /**
     * @brief Records what production still needs, without touching any persistent database.
     *
     * Loads cfg.production_dump and cfg.schema_dir into two scratch databases,
     * diffs them and writes the SQL to cfg.pending_out (truncated, empty when
     * there is no difference). Never applies anything.
     */
    Outcome pending();

    // Last stage reached by the most recent workflow call.
    Stage stage() const { return stage_; }

private:
    Outcome run_sync(bool no_prompt);
    Outcome run_pending();
    void enter(Stage stage);
    void print_pending(const MigrationPlan& plan);

    MigrateConfig cfg_;
    const ResilientConnector& connector_;
    DiffEngine& engine_;
    Prompt& prompt_;
    std::ostream& out_;
    SchemaLoader loader_;
    Stage stage_ = Stage::Start;
};

// Replaces @p file with @p text, creating missing parent directories.
void write_text_file(const std::filesystem::path& file, const std::string& text);
