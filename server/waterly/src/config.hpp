#pragma once

#include <string>

// Daemon configuration loaded from config.json
struct DaemonConfig {
    std::string db_path;            // "/state/waterly.sqlite3" under docker
    std::string migrations_dir;     // extra V__/R__ scripts, empty for none
    int         port      = 8890;
    std::string log_level = "info";
    bool        loaded    = false;
};

// Global instance
extern DaemonConfig g_cfg;

// Load configuration from JSON file.
// Returns true if loaded successfully, false if file missing or invalid.
// On failure, g_cfg is filled with sane defaults.
bool load_config(const std::string &path = "config.json");
