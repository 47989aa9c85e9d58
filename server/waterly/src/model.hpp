#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace waterly {

// =========================================
// Entities
// =========================================

struct Zone {
    std::int64_t id = 0;
    std::string  name;                        // unique, never renamed
    std::string  description;

    std::optional<int> rh_sensor_address;     // RS485/Modbus address
    std::optional<int> npk_sensor_address;    // RS485/Modbus address
    std::optional<int> relay_address;         // GPIO terminal driving the relay

    std::string                created_at;    // UTC, set by the store
    std::optional<std::string> updated_at;    // UTC, refreshed on every update
};

struct Measurement {
    std::int64_t id = 0;
    std::string  zone;                        // zone name
    std::string  name;                        // metric, e.g. "humidity", "npk_n"
    std::string  unit;                        // opaque, never converted
    std::time_t  ts_utc = 0;
    std::optional<std::string> tz;            // timezone label used at capture
    double       reading = 0.0;
    std::string  created_at;
};

// One fetch of one forecast hour. A forecast hour may be fetched many times.
struct Weather {
    std::int64_t id = 0;
    std::time_t  collected_at_utc = 0;
    std::time_t  forecast_ts_utc  = 0;
    std::optional<std::string> tz;
    std::optional<std::string> tag;

    std::optional<double>      temperature_2m;
    std::optional<std::string> temperature_unit;

    std::optional<double>      precipitation_probability;

    std::optional<double>      precipitation;
    std::optional<std::string> precipitation_unit;

    std::optional<double>      soil_moisture_1_to_3cm;
    std::optional<std::string> moisture_unit;

    std::optional<double>      surface_pressure;
    std::optional<std::string> pressure_unit;

    std::string created_at;
};

// Current readings of one zone, one entry per observed metric. Empty when
// the zone has no measurements yet.
struct ZoneLatest {
    Zone                     zone;
    std::vector<Measurement> metrics;
};

} // namespace waterly
