#include "config.hpp"
#include "config_facade.hpp"
#include "errors.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "migration.hpp"
#include "schema.hpp"
#include "store.hpp"

#include <vector>

#ifndef SOFTWARE_VERSION
#define SOFTWARE_VERSION "dev"
#endif

using namespace waterly;

// Store schema, seed zones, then whatever the operator dropped into the
// migrations directory.
static std::vector<Migration> startup_migrations()
{
    std::vector<Migration> all = builtin_migrations();

    const std::vector<Migration> &seed = provisioning_migrations();
    all.insert(all.end(), seed.begin(), seed.end());

    if (!g_cfg.migrations_dir.empty()) {
        std::vector<Migration> extra = load_migration_dir(g_cfg.migrations_dir);
        Logger::info("%zu migration script(s) found in %s", extra.size(), g_cfg.migrations_dir.c_str());
        all.insert(all.end(), extra.begin(), extra.end());
    }
    return all;
}

int main()
{
    Logger::init();
    Logger::info("waterlyd %s starting up", SOFTWARE_VERSION);

    load_config();

    LogLevel level;
    if (Logger::parse_level(g_cfg.log_level, level))
        Logger::set_level(level);
    else
        Logger::warn("unknown log_level '%s', keeping info", g_cfg.log_level.c_str());

    try {
        Store store(g_cfg.db_path, startup_migrations());

        ConfigFacade config(store);
        config.seed_defaults();

        return http_server::start_server(store, g_cfg.port);
    }
    catch (const MigrationError &e) {
        Logger::error("migration failed, refusing to start: %s", e.what());
        return 2;
    }
    catch (const StoreError &e) {
        Logger::error("cannot open store %s: %s", g_cfg.db_path.c_str(), e.what());
        return 1;
    }
}
