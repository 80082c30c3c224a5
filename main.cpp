#include <iostream>
#include <optional>
#include "cli.hpp"
#include "config.hpp"
#include "connector.hpp"
#include "log.hpp"
#include "migra_engine.hpp"
#include "migrator.hpp"
#include "prompt.hpp"

int main(int argc, char** argv)
{
    TaskArgs args(argv + 1, argv + argc);

    std::optional<MigrateConfig> cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FATAL;
    }
    Log::init(cfg->log_level);

    ResilientConnector connector(cfg->retry);
    MigraDiffEngine engine(cfg->migra);
    StreamPrompt prompt(std::cin, std::cout);
    Migrator migrator(*cfg, connector, engine, prompt, std::cout);

    int rc = dispatch(migrator_tasks(migrator), args, std::cout, std::cerr);
    Log::shutdown();
    return rc;
}
