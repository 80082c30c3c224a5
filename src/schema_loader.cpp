#include "schema_loader.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include "errors.hpp"
#include "log.hpp"

namespace {

    std::string read_file(const fs::path& file) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) THROW_AS(SchemaLoadError, "Schema file %s does not exist", file.string().c_str());
        std::ifstream in(file, std::ios::binary);
        if (!in) THROW_AS(SchemaLoadError, "Cannot open schema file %s", file.string().c_str());
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) THROW_AS(SchemaLoadError, "Cannot read schema file %s", file.string().c_str());
        return ss.str();
    }
}

std::vector<fs::path> SchemaLoader::discover(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        THROW_AS(SchemaLoadError, "Schema folder %s does not exist or is not a directory", dir.string().c_str());
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(dir, fs::directory_options::follow_directory_symlink, ec);
    if (ec) THROW_AS(SchemaLoadError, "Cannot list %s: %s", dir.string().c_str(), ec.message().c_str());
    for (const auto& entry : it) {
        if (entry.is_regular_file() && entry.path().extension() == ".sql") files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

void SchemaLoader::exec_file(SQLConnection& conn, const fs::path& file) {
    std::string sql = read_file(file);
    if (trim(sql).empty()) {
        LOG_DEBUG("Skipping empty schema file {}", file.string());
        return;
    }
    conn.set_autocommit(true);
    try {
        conn.exec(sql);
    } catch (const std::exception& ex) {
        THROW_AS(SchemaLoadError, "Loading %s failed: %s", file.string().c_str(), ex.what());
    }
    LOG_DEBUG("Loaded {}", file.string());
}

void SchemaLoader::load_from_folder(SchemaSession& session, const fs::path& dir) const {
    auto files = discover(dir);
    LOG_INFO("Loading {} schema file(s) from {} into {}", files.size(), dir.string(), session.target().dbname());
    for (const auto& f : files) exec_file(session.conn(), f);
}

void SchemaLoader::load_from_file(SchemaSession& session, const fs::path& file) const {
    LOG_INFO("Loading {} into {}", file.string(), session.target().dbname());
    exec_file(session.conn(), file);
}
