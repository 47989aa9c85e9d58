#pragma once

#include "db.hpp"

#include <optional>
#include <string>
#include <vector>

namespace waterly {

// A schema or seed-data change. A migration without a version is
// repeatable: it runs again whenever its checksum changes.
struct Migration {
    std::optional<std::string> version;
    std::string description;
    std::string checksum;       // sha-256 hex of script
    std::string script;
};

// One row of migration_history.
struct MigrationRecord {
    int installed_rank = 0;
    std::optional<std::string> version;
    std::string description;
    std::string checksum;
    std::string installed_on;   // UTC
};

Migration make_migration(const std::optional<std::string> &version,
                         const std::string &description,
                         const std::string &script);

// Offered migrations whose checksum is not in the ledger yet, in the order
// they were offered.
std::vector<Migration> pending_migrations(const std::vector<Migration> &known,
                                          const std::vector<MigrationRecord> &applied);

// Dotted numeric compare: <0, 0, >0. "1.10" sorts after "1.9"; a missing
// component counts as 0.
int compare_versions(const std::string &a, const std::string &b);

// Loads V<version>__<description>.sql and R__<description>.sql from dir.
// Versioned scripts come first in version order, then repeatables by name.
std::vector<Migration> load_migration_dir(const std::string &dir);

class MigrationLedger {
public:
    // Creates migration_history if missing.
    explicit MigrationLedger(Database &db);

    std::vector<MigrationRecord> history() const;

    // Ledger rows by installation rank, without touching the schema.
    static std::vector<MigrationRecord> read_history(const Database &db);
    std::vector<Migration> pending(const std::vector<Migration> &known) const;

    // Runs the script and records it in one transaction. Returns false when
    // the same content is already recorded under the same version.
    bool apply(const Migration &m);

    // Applies everything pending, in order. Stops at the first failure.
    int migrate(const std::vector<Migration> &known);

private:
    Database &db_;
};

} // namespace waterly
