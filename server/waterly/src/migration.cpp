#include "migration.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace waterly {

namespace fs = std::filesystem;

static const char *LEDGER_DDL =
    "CREATE TABLE IF NOT EXISTS migration_history ("
    "  installed_rank  INTEGER PRIMARY KEY,"
    "  version         TEXT,"
    "  description     TEXT NOT NULL,"
    "  checksum        TEXT NOT NULL,"
    "  installed_on    TEXT NOT NULL DEFAULT (datetime('now'))"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS ux_migration_history_version  ON migration_history(version);"
    "CREATE UNIQUE INDEX IF NOT EXISTS ux_migration_history_checksum ON migration_history(checksum);"
    "CREATE INDEX IF NOT EXISTS idx_migration_history_installed_on ON migration_history(installed_on);";

static std::string describe(const Migration &m)
{
    if (m.version)
        return "migration " + *m.version + " (" + m.description + ")";
    return "repeatable migration (" + m.description + ")";
}

static bool is_version_string(const std::string &v)
{
    if (v.empty() || v.front() == '.' || v.back() == '.')
        return false;

    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (c == '.') {
            if (v[i + 1] == '.')
                return false;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// =========================================
// Free functions
// =========================================

Migration make_migration(const std::optional<std::string> &version,
                         const std::string &description,
                         const std::string &script)
{
    Migration m;
    m.version     = version;
    m.description = description;
    m.script      = script;
    m.checksum    = utils::sha256_hex(script);
    return m;
}

std::vector<Migration> pending_migrations(const std::vector<Migration> &known,
                                          const std::vector<MigrationRecord> &applied)
{
    std::set<std::string> recorded;
    for (const auto &r : applied)
        recorded.insert(r.checksum);

    std::vector<Migration> out;
    for (const auto &m : known) {
        if (recorded.count(m.checksum) == 0)
            out.push_back(m);
    }
    return out;
}

int compare_versions(const std::string &a, const std::string &b)
{
    size_t ia = 0;
    size_t ib = 0;

    while (ia < a.size() || ib < b.size()) {
        size_t ea = a.find('.', ia);
        size_t eb = b.find('.', ib);
        if (ea == std::string::npos) ea = a.size();
        if (eb == std::string::npos) eb = b.size();

        long long na = (ia < a.size()) ? std::strtoll(a.substr(ia, ea - ia).c_str(), nullptr, 10) : 0;
        long long nb = (ib < b.size()) ? std::strtoll(b.substr(ib, eb - ib).c_str(), nullptr, 10) : 0;

        if (na != nb)
            return (na < nb) ? -1 : 1;

        ia = (ea < a.size()) ? ea + 1 : a.size();
        ib = (eb < b.size()) ? eb + 1 : b.size();
    }
    return 0;
}

std::vector<Migration> load_migration_dir(const std::string &dir)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        throw MigrationError("migration directory not found: " + dir);

    fs::directory_iterator it(dir, ec);
    if (ec)
        throw MigrationError("cannot list " + dir + ": " + ec.message());

    std::vector<Migration> versioned;
    std::vector<std::pair<std::string, Migration>> repeatable;

    for (const auto &entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".sql")
            continue;

        const std::string file = entry.path().filename().string();
        const std::string stem = entry.path().stem().string();

        size_t sep = stem.find("__");
        if (sep == std::string::npos || sep == 0)
            throw MigrationError("unrecognised migration file name: " + file);

        std::string prefix = stem.substr(0, sep);
        std::string desc   = stem.substr(sep + 2);
        std::replace(desc.begin(), desc.end(), '_', ' ');

        std::string script;
        if (!utils::read_file(entry.path().string(), script))
            throw MigrationError("cannot read migration " + entry.path().string());

        if (prefix == "R") {
            repeatable.emplace_back(file, make_migration(std::nullopt, desc, script));
        } else if (prefix[0] == 'V' && is_version_string(prefix.substr(1))) {
            versioned.push_back(make_migration(prefix.substr(1), desc, script));
        } else {
            throw MigrationError("unrecognised migration file name: " + file);
        }
    }

    std::sort(versioned.begin(), versioned.end(),
              [](const Migration &a, const Migration &b) {
                  return compare_versions(*a.version, *b.version) < 0;
              });

    for (size_t i = 1; i < versioned.size(); ++i) {
        if (compare_versions(*versioned[i - 1].version, *versioned[i].version) == 0)
            throw MigrationError("duplicate migration version " + *versioned[i].version + " in " + dir);
    }

    std::sort(repeatable.begin(), repeatable.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });

    std::vector<Migration> out = versioned;
    for (auto &r : repeatable)
        out.push_back(r.second);
    return out;
}

// =========================================
// MigrationLedger
// =========================================

MigrationLedger::MigrationLedger(Database &db)
    : db_(db)
{
    try {
        db_.exec(LEDGER_DDL);
    }
    catch (const StorageError &e) {
        throw MigrationError(std::string("cannot create migration ledger: ") + e.what());
    }
}

std::vector<MigrationRecord> MigrationLedger::history() const
{
    return read_history(db_);
}

std::vector<MigrationRecord> MigrationLedger::read_history(const Database &db)
{
    Statement st(db,
        "SELECT installed_rank, version, description, checksum, installed_on "
        "FROM migration_history "
        "ORDER BY installed_rank");

    std::vector<MigrationRecord> out;
    while (st.step()) {
        MigrationRecord r;
        r.installed_rank = static_cast<int>(st.column_int64(0));
        r.version        = st.column_opt_text(1);
        r.description    = st.column_text(2);
        r.checksum       = st.column_text(3);
        r.installed_on   = st.column_text(4);
        out.push_back(r);
    }
    return out;
}

std::vector<Migration> MigrationLedger::pending(const std::vector<Migration> &known) const
{
    return pending_migrations(known, history());
}

bool MigrationLedger::apply(const Migration &m)
{
    const std::string label = describe(m);

    if (m.checksum.empty())
        throw MigrationError(label + ": missing checksum");

    Transaction tx(db_);

    {
        Statement st(db_, "SELECT version FROM migration_history WHERE checksum = ?1");
        st.bind_text(1, m.checksum);
        if (st.step()) {
            std::optional<std::string> recorded = st.column_opt_text(0);
            if (recorded == m.version) {
                Logger::debug("%s already applied", label.c_str());
                return false;
            }
            throw MigrationError(label + ": identical content already applied as " +
                                 (recorded ? "version " + *recorded : std::string("a repeatable migration")));
        }
    }

    if (m.version) {
        Statement st(db_, "SELECT checksum FROM migration_history WHERE version = ?1");
        st.bind_text(1, *m.version);
        if (st.step()) {
            throw MigrationError(label + ": schema drift, version already applied with checksum " +
                                 st.column_text(0) + ", offered " + m.checksum);
        }
    }

    try {
        db_.exec(m.script);
    }
    catch (const StorageError &e) {
        throw MigrationError(label + " failed: " + e.what());
    }

    sqlite3_int64 rank = 1;
    {
        Statement st(db_, "SELECT COALESCE(MAX(installed_rank), 0) + 1 FROM migration_history");
        if (st.step())
            rank = st.column_int64(0);
    }

    {
        Statement st(db_,
            "INSERT INTO migration_history(installed_rank, version, description, checksum) "
            "VALUES (?1, ?2, ?3, ?4)");
        st.bind_int64(1, rank);
        st.bind_opt_text(2, m.version);
        st.bind_text(3, m.description);
        st.bind_text(4, m.checksum);
        if (st.step_rc() != SQLITE_DONE)
            throw MigrationError(label + ": cannot record in ledger: " + db_.errmsg());
    }

    tx.commit();
    Logger::info("applied %s at rank %lld (hash %s)",
                 label.c_str(), (long long)rank, m.checksum.substr(0, 12).c_str());
    return true;
}

int MigrationLedger::migrate(const std::vector<Migration> &known)
{
    std::vector<Migration> todo = pending(known);
    if (todo.empty()) {
        Logger::info("database schema up to date (%zu migrations recorded)", history().size());
        return 0;
    }

    Logger::info("%zu pending migration(s)", todo.size());

    int applied = 0;
    for (const auto &m : todo) {
        if (apply(m))
            ++applied;
    }
    return applied;
}

} // namespace waterly
