#include "store.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cmath>

using nlohmann::json;

namespace waterly {

// =========================================
// Row readers
// =========================================

static const char *ZONE_COLUMNS =
    "SELECT id, name, description, rh_sensor_address, npk_sensor_address, "
    "       relay_address, created_at, updated_at "
    "FROM zone ";

static const char *MEASUREMENT_COLUMNS =
    "SELECT m.id, z.name, m.name, m.unit, m.ts_utc, m.tz, m.reading, m.created_at "
    "FROM measurement m "
    "JOIN zone z ON z.id = m.zone_id ";

static const char *WEATHER_COLUMNS =
    "SELECT id, collected_at_utc, forecast_ts_utc, tz, tag, "
    "       temperature_2m, temperature_unit, precipitation_probability, "
    "       precipitation, precipitation_unit, soil_moisture_1_to_3cm, moisture_unit, "
    "       surface_pressure, pressure_unit, created_at "
    "FROM weather ";

static Zone read_zone(const Statement &st)
{
    Zone z;
    z.id                 = st.column_int64(0);
    z.name               = st.column_text(1);
    z.description        = st.column_text(2);
    z.rh_sensor_address  = st.column_opt_int(3);
    z.npk_sensor_address = st.column_opt_int(4);
    z.relay_address      = st.column_opt_int(5);
    z.created_at         = st.column_text(6);
    z.updated_at         = st.column_opt_text(7);
    return z;
}

static Measurement read_measurement(const Statement &st)
{
    Measurement m;
    m.id         = st.column_int64(0);
    m.zone       = st.column_text(1);
    m.name       = st.column_text(2);
    m.unit       = st.column_text(3);
    m.ts_utc     = static_cast<std::time_t>(st.column_int64(4));
    m.tz         = st.column_opt_text(5);
    m.reading    = st.column_double(6);
    m.created_at = st.column_text(7);
    return m;
}

static Weather read_weather(const Statement &st)
{
    Weather w;
    w.id                        = st.column_int64(0);
    w.collected_at_utc          = static_cast<std::time_t>(st.column_int64(1));
    w.forecast_ts_utc           = static_cast<std::time_t>(st.column_int64(2));
    w.tz                        = st.column_opt_text(3);
    w.tag                       = st.column_opt_text(4);
    w.temperature_2m            = st.column_opt_double(5);
    w.temperature_unit          = st.column_opt_text(6);
    w.precipitation_probability = st.column_opt_double(7);
    w.precipitation             = st.column_opt_double(8);
    w.precipitation_unit        = st.column_opt_text(9);
    w.soil_moisture_1_to_3cm    = st.column_opt_double(10);
    w.moisture_unit             = st.column_opt_text(11);
    w.surface_pressure          = st.column_opt_double(12);
    w.pressure_unit             = st.column_opt_text(13);
    w.created_at                = st.column_text(14);
    return w;
}

static std::optional<Zone> find_zone(const Database &db, const std::string &name)
{
    std::string sql = std::string(ZONE_COLUMNS) + "WHERE name = ?1";
    Statement st(db, sql.c_str());
    st.bind_text(1, name);
    if (!st.step())
        return std::nullopt;
    return read_zone(st);
}

// =========================================
// Validation
// =========================================

static void require_text(const std::string &value, const char *what)
{
    if (value.empty())
        throw ValidationError(std::string(what) + " is required");
}

static void check_field(const std::optional<double> &value,
                        const std::optional<std::string> &unit,
                        const char *field)
{
    if (!value)
        return;
    if (!std::isfinite(*value))
        throw ValidationError(std::string("weather ") + field + " is not a finite number");
    if (!unit || unit->empty())
        throw ValidationError(std::string("weather ") + field + " has no unit");
}

// =========================================
// Store
// =========================================

Store::Store(const std::string &path, const std::vector<Migration> &migrations)
    : db_(path)
{
    MigrationLedger ledger(db_);
    int applied = ledger.migrate(migrations);
    Logger::info("store ready at %s, %d migration(s) applied", path.c_str(), applied);
}

Zone Store::upsert_zone(const Zone &zone)
{
    require_text(zone.name, "zone name");

    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    {
        Statement st(db_,
            "INSERT INTO zone(name, description, rh_sensor_address, npk_sensor_address, relay_address) "
            "VALUES (?1, ?2, ?3, ?4, ?5) "
            "ON CONFLICT(name) DO UPDATE SET "
            "  description        = excluded.description,"
            "  rh_sensor_address  = excluded.rh_sensor_address,"
            "  npk_sensor_address = excluded.npk_sensor_address,"
            "  relay_address      = excluded.relay_address");
        st.bind_text(1, zone.name);
        st.bind_text(2, zone.description);
        st.bind_opt_int(3, zone.rh_sensor_address);
        st.bind_opt_int(4, zone.npk_sensor_address);
        st.bind_opt_int(5, zone.relay_address);
        st.step();
    }

    std::optional<Zone> stored = find_zone(db_, zone.name);
    if (!stored)
        throw StorageError("zone '" + zone.name + "' missing after upsert");

    tx.commit();
    return *stored;
}

std::optional<Zone> Store::zone(const std::string &name) const
{
    std::lock_guard<std::mutex> guard(lock_);
    return find_zone(db_, name);
}

std::vector<Zone> Store::zones() const
{
    std::lock_guard<std::mutex> guard(lock_);

    std::string sql = std::string(ZONE_COLUMNS) + "ORDER BY name";
    Statement st(db_, sql.c_str());

    std::vector<Zone> out;
    while (st.step())
        out.push_back(read_zone(st));
    return out;
}

int Store::delete_zone(const std::string &name)
{
    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    std::optional<Zone> z = find_zone(db_, name);
    if (!z)
        throw NotFoundError("zone not found: " + name);

    int removed = 0;
    {
        Statement st(db_, "SELECT COUNT(*) FROM measurement WHERE zone_id = ?1");
        st.bind_int64(1, z->id);
        if (st.step())
            removed = static_cast<int>(st.column_int64(0));
    }

    {
        Statement st(db_, "DELETE FROM zone WHERE id = ?1");
        st.bind_int64(1, z->id);
        st.step();
    }

    tx.commit();
    return removed;
}

std::int64_t Store::record_measurement(const Measurement &m)
{
    require_text(m.zone, "measurement zone");
    require_text(m.name, "measurement metric name");
    require_text(m.unit, "measurement unit");
    if (!std::isfinite(m.reading))
        throw ValidationError("measurement reading for " + m.zone + "/" + m.name + " is not a finite number");

    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    std::optional<Zone> z = find_zone(db_, m.zone);
    if (!z)
        throw NotFoundError("zone not found: " + m.zone);

    {
        Statement st(db_,
            "INSERT INTO measurement(zone_id, name, unit, ts_utc, tz, reading) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
        st.bind_int64(1, z->id);
        st.bind_text(2, m.name);
        st.bind_text(3, m.unit);
        st.bind_int64(4, static_cast<sqlite3_int64>(m.ts_utc));
        st.bind_opt_text(5, m.tz);
        st.bind_double(6, m.reading);

        int rc = st.step_rc();
        if (rc == SQLITE_CONSTRAINT_UNIQUE)
            throw DuplicateSampleError(m.zone, m.name, m.ts_utc);
        if (rc != SQLITE_DONE)
            throw StorageError("insert measurement failed: " + db_.errmsg());
    }

    std::int64_t id = db_.last_insert_id();
    tx.commit();
    return id;
}

std::vector<Measurement> Store::measurements(const std::string &zone,
                                             const std::string &metric,
                                             std::time_t from,
                                             std::time_t to) const
{
    std::lock_guard<std::mutex> guard(lock_);

    std::string sql = std::string(MEASUREMENT_COLUMNS) +
        "WHERE z.name = ?1 AND m.name = ?2 AND m.ts_utc BETWEEN ?3 AND ?4 "
        "ORDER BY m.ts_utc";
    Statement st(db_, sql.c_str());
    st.bind_text(1, zone);
    st.bind_text(2, metric);
    st.bind_int64(3, static_cast<sqlite3_int64>(from));
    st.bind_int64(4, static_cast<sqlite3_int64>(to));

    std::vector<Measurement> out;
    while (st.step())
        out.push_back(read_measurement(st));
    return out;
}

std::vector<Measurement> Store::latest_measurement_candidates(const std::optional<std::string> &zone,
                                                              const std::optional<std::string> &metric) const
{
    std::lock_guard<std::mutex> guard(lock_);

    std::string sql = std::string(MEASUREMENT_COLUMNS) +
        "JOIN ("
        "  SELECT zone_id, name, MAX(ts_utc) AS max_ts"
        "  FROM measurement"
        "  GROUP BY zone_id, name"
        ") t ON t.zone_id = m.zone_id AND t.name = m.name AND t.max_ts = m.ts_utc "
        "WHERE (?1 IS NULL OR z.name = ?1) AND (?2 IS NULL OR m.name = ?2) "
        "ORDER BY z.name, m.name";
    Statement st(db_, sql.c_str());
    st.bind_opt_text(1, zone);
    st.bind_opt_text(2, metric);

    std::vector<Measurement> out;
    while (st.step())
        out.push_back(read_measurement(st));
    return out;
}

std::int64_t Store::record_weather(const Weather &w)
{
    if (w.collected_at_utc < 0 || w.forecast_ts_utc < 0)
        throw ValidationError("weather timestamps must not be negative");

    check_field(w.temperature_2m,         w.temperature_unit,   "temperature_2m");
    check_field(w.precipitation,          w.precipitation_unit, "precipitation");
    check_field(w.soil_moisture_1_to_3cm, w.moisture_unit,      "soil_moisture_1_to_3cm");
    check_field(w.surface_pressure,       w.pressure_unit,      "surface_pressure");
    if (w.precipitation_probability && !std::isfinite(*w.precipitation_probability))
        throw ValidationError("weather precipitation_probability is not a finite number");

    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    {
        Statement st(db_,
            "INSERT INTO weather(collected_at_utc, forecast_ts_utc, tz, tag, "
            "  temperature_2m, temperature_unit, precipitation_probability, "
            "  precipitation, precipitation_unit, soil_moisture_1_to_3cm, moisture_unit, "
            "  surface_pressure, pressure_unit) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)");
        st.bind_int64(1, static_cast<sqlite3_int64>(w.collected_at_utc));
        st.bind_int64(2, static_cast<sqlite3_int64>(w.forecast_ts_utc));
        st.bind_opt_text(3, w.tz);
        st.bind_opt_text(4, w.tag);
        st.bind_opt_double(5, w.temperature_2m);
        st.bind_opt_text(6, w.temperature_unit);
        st.bind_opt_double(7, w.precipitation_probability);
        st.bind_opt_double(8, w.precipitation);
        st.bind_opt_text(9, w.precipitation_unit);
        st.bind_opt_double(10, w.soil_moisture_1_to_3cm);
        st.bind_opt_text(11, w.moisture_unit);
        st.bind_opt_double(12, w.surface_pressure);
        st.bind_opt_text(13, w.pressure_unit);
        st.step();
    }

    std::int64_t id = db_.last_insert_id();
    tx.commit();
    return id;
}

std::vector<Weather> Store::weather_rows(std::time_t from, std::time_t to) const
{
    std::lock_guard<std::mutex> guard(lock_);

    std::string sql = std::string(WEATHER_COLUMNS) +
        "WHERE forecast_ts_utc BETWEEN ?1 AND ?2 "
        "ORDER BY forecast_ts_utc, collected_at_utc, id";
    Statement st(db_, sql.c_str());
    st.bind_int64(1, static_cast<sqlite3_int64>(from));
    st.bind_int64(2, static_cast<sqlite3_int64>(to));

    std::vector<Weather> out;
    while (st.step())
        out.push_back(read_weather(st));
    return out;
}

std::vector<Weather> Store::forecast_rows(std::time_t from, int count) const
{
    if (count == 0)
        return {};

    const bool forward = count > 0;
    const sqlite3_int64 how_many = forward ? count : -static_cast<sqlite3_int64>(count);

    std::string sql = std::string(WEATHER_COLUMNS) +
        "WHERE precipitation_probability IS NOT NULL "
        "  AND forecast_ts_utc IN ("
        "    SELECT DISTINCT forecast_ts_utc FROM weather"
        "    WHERE precipitation_probability IS NOT NULL" +
        (forward ? std::string("      AND forecast_ts_utc >= ?1 ORDER BY forecast_ts_utc ASC")
                 : std::string("      AND forecast_ts_utc <= ?1 ORDER BY forecast_ts_utc DESC")) +
        "    LIMIT ?2"
        "  ) "
        "ORDER BY forecast_ts_utc, collected_at_utc, id";

    std::lock_guard<std::mutex> guard(lock_);

    Statement st(db_, sql.c_str());
    st.bind_int64(1, static_cast<sqlite3_int64>(from));
    st.bind_int64(2, how_many);

    std::vector<Weather> out;
    while (st.step())
        out.push_back(read_weather(st));
    return out;
}

std::optional<json> Store::get_config(Setting key) const
{
    std::lock_guard<std::mutex> guard(lock_);

    Statement st(db_, "SELECT value FROM config WHERE type = ?1");
    st.bind_text(1, setting_key(key));
    if (!st.step())
        return std::nullopt;

    try {
        return json::parse(st.column_text(0));
    }
    catch (const json::parse_error &e) {
        throw StorageError(std::string("stored value of ") + setting_key(key) + " is not JSON: " + e.what());
    }
}

void Store::set_config(Setting key, const json &value)
{
    decode_setting(key, value);

    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    {
        Statement st(db_,
            "INSERT INTO config(type, value) VALUES (?1, ?2) "
            "ON CONFLICT(type) DO UPDATE SET value = excluded.value");
        st.bind_text(1, setting_key(key));
        st.bind_text(2, value.dump());
        st.step();
    }

    tx.commit();
}

bool Store::insert_config_if_absent(Setting key, const json &value)
{
    decode_setting(key, value);

    std::lock_guard<std::mutex> guard(lock_);
    Transaction tx(db_);

    {
        Statement st(db_,
            "INSERT INTO config(type, value) VALUES (?1, ?2) "
            "ON CONFLICT(type) DO NOTHING");
        st.bind_text(1, setting_key(key));
        st.bind_text(2, value.dump());
        st.step();
    }

    bool written = sqlite3_changes(db_.handle()) > 0;
    tx.commit();
    return written;
}

std::map<std::string, json> Store::all_config() const
{
    std::lock_guard<std::mutex> guard(lock_);

    Statement st(db_, "SELECT type, value FROM config ORDER BY type");

    std::map<std::string, json> out;
    while (st.step()) {
        std::string key = st.column_text(0);
        try {
            out[key] = json::parse(st.column_text(1));
        }
        catch (const json::parse_error &e) {
            throw StorageError("stored value of " + key + " is not JSON: " + e.what());
        }
    }
    return out;
}

std::vector<MigrationRecord> Store::migration_history() const
{
    std::lock_guard<std::mutex> guard(lock_);
    return MigrationLedger::read_history(db_);
}

} // namespace waterly
