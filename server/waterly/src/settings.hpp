#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace waterly {

// Operator-tunable settings. Each key owns exactly one value shape.
enum class Setting {
    HumidityTargetPercent,
    WateringStartTime,
    WateringMaxMinutesPerZone,
    LastWateringDate,
    RainCancelProbabilityThreshold,
    Units,
    WeatherCheckIntervalSeconds,
    WeatherCheckPreWateringSeconds,
    WeatherLastCheckTimestamp,
    SensorReadIntervalSeconds,
    MinimumSensorHumidityPercent,
    TrendMaxSamples,
    LocalTimezone,
    Location,
    GardeningSeason,
};

const std::vector<Setting> &all_settings();

// Stored key, e.g. "LOCAL_TIMEZONE".
const char *setting_key(Setting s);
std::optional<Setting> setting_from_key(const std::string &key);

// =========================================
// Value shapes
// =========================================

// {"Z1": 70.0, "Z2": 65.5}, percent per zone name
struct ZonePercents {
    std::map<std::string, double> by_zone;
};

// {"value": "20:30"}
struct TimeOfDay {
    int hour   = 0;
    int minute = 0;
};

// {"value": 600}, non-negative minutes, seconds or sample counts
struct Count {
    std::int64_t value = 0;
};

// {"value": 50}, 0..100
struct Percent {
    double value = 0.0;
};

// {"value": "imperial" | "metric"}
enum class UnitSystem { Imperial, Metric };

// {"value": null | "YYYY-MM-DD"}
struct OptionalDate {
    std::optional<std::string> ymd;
};

// {"value": null} or {"__type__": "datetime", "iso": "...", "tz": "..."}
struct OptionalInstant {
    std::optional<std::string> iso;
    std::string tz;
};

// {"value": "America/Chicago"}
struct TimezoneName {
    std::string name;
};

// {"latitude": 45.03, "longitude": -93.45}
struct GeoLocation {
    double latitude  = 0.0;
    double longitude = 0.0;
};

// {"start": "03-31", "stop": "10-31"}, MM-DD inclusive
struct SeasonBounds {
    std::string start;
    std::string stop;
};

using SettingValue = std::variant<ZonePercents,
                                  TimeOfDay,
                                  Count,
                                  Percent,
                                  UnitSystem,
                                  OptionalDate,
                                  OptionalInstant,
                                  TimezoneName,
                                  GeoLocation,
                                  SeasonBounds>;

// Throws ValidationError naming the key and the offending field.
SettingValue decode_setting(Setting s, const nlohmann::json &j);
nlohmann::json encode_setting(const SettingValue &v);

nlohmann::json default_setting(Setting s);

} // namespace waterly
