#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <unistd.h>

using json = nlohmann::json;

static const char *DB_PATH_DOCKER = "/state/waterly.sqlite3";
static const char *DB_PATH_LOCAL  = "waterly.sqlite3";

// Global instance
DaemonConfig g_cfg;

static std::string default_db_path()
{
    if (access("/state", F_OK) == 0)
        return DB_PATH_DOCKER;
    return DB_PATH_LOCAL;
}

static void set_defaults()
{
    g_cfg = DaemonConfig{};
    g_cfg.db_path = default_db_path();
}

bool load_config(const std::string &path)
{
    set_defaults();

    std::string raw;
    if (!waterly::utils::read_file(path, raw)) {
        waterly::Logger::warn("%s missing, using defaults", path.c_str());
        return false;
    }

    try {
        json j = json::parse(raw);

        g_cfg.db_path        = j.value("db_path", g_cfg.db_path);
        g_cfg.migrations_dir = j.value("migrations_dir", std::string());
        g_cfg.port           = j.value("port", g_cfg.port);
        g_cfg.log_level      = j.value("log_level", g_cfg.log_level);

        if (g_cfg.port <= 0 || g_cfg.port > 65535) {
            waterly::Logger::warn("%s: port %d out of range, using 8890", path.c_str(), g_cfg.port);
            g_cfg.port = 8890;
        }

        g_cfg.loaded = true;
        return true;
    }
    catch (const json::exception &e) {
        waterly::Logger::warn("%s invalid (%s), using defaults", path.c_str(), e.what());
        set_defaults();
        return false;
    }
}
