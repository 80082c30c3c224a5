#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "schema_session.hpp"

namespace fs = std::filesystem;

/**
 * Applies SQL definition files to a session, in autocommit mode.
 *
 * Each file is sent as one batch. A failing file raises SchemaLoadError; files
 * already executed stay applied (the targets are scratch databases).
 */
class SchemaLoader {
public:
    // Every *.sql below @p dir, recursively, executed in lexicographic path order.
    void load_from_folder(SchemaSession& session, const fs::path& dir) const;

    // The whole file as one batch; an empty file is a no-op.
    void load_from_file(SchemaSession& session, const fs::path& file) const;

    // The files load_from_folder() would execute, in execution order.
    static std::vector<fs::path> discover(const fs::path& dir);

private:
    static void exec_file(SQLConnection& conn, const fs::path& file);
};
