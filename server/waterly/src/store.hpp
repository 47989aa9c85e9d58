#pragma once

#include "db.hpp"
#include "migration.hpp"
#include "model.hpp"
#include "schema.hpp"
#include "settings.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace waterly {

// Durable telemetry and configuration store.
//
// Construction opens the database and applies every pending migration
// before returning, so no read or write can run against an older schema.
// Each mutating call is one transaction. Errors are thrown, never retried.
class Store {
public:
    explicit Store(const std::string &path,
                   const std::vector<Migration> &migrations = builtin_migrations());

    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    // ---- zones ----
    Zone upsert_zone(const Zone &zone);
    std::optional<Zone> zone(const std::string &name) const;
    std::vector<Zone> zones() const;

    // Removes the zone and all of its measurements. Returns how many
    // measurements went with it.
    int delete_zone(const std::string &name);

    // ---- measurements ----
    std::int64_t record_measurement(const Measurement &m);

    // History of one (zone, metric), ascending, bounds inclusive.
    std::vector<Measurement> measurements(const std::string &zone,
                                          const std::string &metric,
                                          std::time_t from,
                                          std::time_t to) const;

    // Rows holding the newest timestamp of their (zone, metric), optionally
    // narrowed to one zone and/or metric. Input for the resolver.
    std::vector<Measurement> latest_measurement_candidates(const std::optional<std::string> &zone = std::nullopt,
                                                           const std::optional<std::string> &metric = std::nullopt) const;

    // ---- weather ----
    std::int64_t record_weather(const Weather &w);

    // Every fetch whose forecast hour is in [from, to], by forecast hour then
    // collection time.
    std::vector<Weather> weather_rows(std::time_t from, std::time_t to) const;

    // Forecast fetches (precipitation_probability present) of the first
    // |count| distinct forecast hours from `from`: forward in time for a
    // positive count, backward for a negative one, both bounds inclusive.
    // Rows come back by forecast hour then collection time.
    std::vector<Weather> forecast_rows(std::time_t from, int count) const;

    // ---- config ----
    std::optional<nlohmann::json> get_config(Setting key) const;
    void set_config(Setting key, const nlohmann::json &value);

    // Writes value only when key has no row yet. Returns true if written.
    bool insert_config_if_absent(Setting key, const nlohmann::json &value);

    std::map<std::string, nlohmann::json> all_config() const;

    // ---- diagnostics ----
    std::vector<MigrationRecord> migration_history() const;

private:
    mutable std::mutex lock_;
    Database           db_;
};

} // namespace waterly
