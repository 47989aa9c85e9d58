#include "settings.hpp"
#include "errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

using nlohmann::json;

namespace waterly {

struct SettingInfo {
    Setting     setting;
    const char *key;
};

static const SettingInfo SETTINGS[] = {
    { Setting::HumidityTargetPercent,          "HUMIDITY_TARGET_PERCENT" },
    { Setting::WateringStartTime,              "WATERING_START_TIME" },
    { Setting::WateringMaxMinutesPerZone,      "WATERING_MAX_MINUTES_PER_ZONE" },
    { Setting::LastWateringDate,               "LAST_WATERING_DATE" },
    { Setting::RainCancelProbabilityThreshold, "RAIN_CANCEL_PROBABILITY_THRESHOLD" },
    { Setting::Units,                          "UNITS" },
    { Setting::WeatherCheckIntervalSeconds,    "WEATHER_CHECK_INTERVAL_SECONDS" },
    { Setting::WeatherCheckPreWateringSeconds, "WEATHER_CHECK_PRE_WATERING_SECONDS" },
    { Setting::WeatherLastCheckTimestamp,      "WEATHER_LAST_CHECK_TIMESTAMP" },
    { Setting::SensorReadIntervalSeconds,      "SENSOR_READ_INTERVAL_SECONDS" },
    { Setting::MinimumSensorHumidityPercent,   "MINIMUM_SENSOR_HUMIDITY_PERCENT" },
    { Setting::TrendMaxSamples,                "TREND_MAX_SAMPLES" },
    { Setting::LocalTimezone,                  "LOCAL_TIMEZONE" },
    { Setting::Location,                       "LOCATION" },
    { Setting::GardeningSeason,                "GARDENING_SEASON" },
};

const std::vector<Setting> &all_settings()
{
    static const std::vector<Setting> all = [] {
        std::vector<Setting> v;
        for (const auto &s : SETTINGS)
            v.push_back(s.setting);
        return v;
    }();
    return all;
}

const char *setting_key(Setting s)
{
    for (const auto &info : SETTINGS) {
        if (info.setting == s)
            return info.key;
    }
    return "UNKNOWN";
}

std::optional<Setting> setting_from_key(const std::string &key)
{
    for (const auto &info : SETTINGS) {
        if (key == info.key)
            return info.setting;
    }
    return std::nullopt;
}

// =========================================
// Field checks
// =========================================

static bool all_digits(const std::string &s, size_t pos, size_t len)
{
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

static int to_int(const std::string &s, size_t pos, size_t len)
{
    return std::atoi(s.substr(pos, len).c_str());
}

// "MM-DD"
static bool is_month_day(const std::string &s)
{
    if (s.size() != 5 || s[2] != '-' || !all_digits(s, 0, 2) || !all_digits(s, 3, 2))
        return false;
    int m = to_int(s, 0, 2);
    int d = to_int(s, 3, 2);
    return m >= 1 && m <= 12 && d >= 1 && d <= 31;
}

// "YYYY-MM-DD"
static bool is_date(const std::string &s)
{
    return s.size() == 10 && s[4] == '-' && all_digits(s, 0, 4) && is_month_day(s.substr(5));
}

[[noreturn]] static void invalid(Setting s, const std::string &what)
{
    throw ValidationError(std::string("invalid value for ") + setting_key(s) + ": " + what);
}

static const json &require_object(Setting s, const json &j)
{
    if (!j.is_object())
        invalid(s, "expected a JSON object");
    return j;
}

static const json &require_field(Setting s, const json &j, const char *name)
{
    require_object(s, j);
    auto it = j.find(name);
    if (it == j.end())
        invalid(s, std::string("missing field '") + name + "'");
    return *it;
}

static double require_number(Setting s, const json &v, const std::string &field, double lo, double hi)
{
    if (!v.is_number())
        invalid(s, "'" + field + "' must be a number");
    double d = v.get<double>();
    if (!std::isfinite(d) || d < lo || d > hi)
        invalid(s, "'" + field + "' out of range");
    return d;
}

// =========================================
// Decoders
// =========================================

static ZonePercents decode_zone_percents(Setting s, const json &j)
{
    require_object(s, j);
    ZonePercents out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty())
            invalid(s, "empty zone name");
        out.by_zone[it.key()] = require_number(s, it.value(), it.key(), 0.0, 100.0);
    }
    return out;
}

static TimeOfDay decode_time_of_day(Setting s, const json &j)
{
    const json &v = require_field(s, j, "value");
    if (!v.is_string())
        invalid(s, "'value' must be an \"HH:MM\" string");

    const std::string t = v.get<std::string>();
    if (t.size() != 5 || t[2] != ':' || !all_digits(t, 0, 2) || !all_digits(t, 3, 2))
        invalid(s, "'value' must be an \"HH:MM\" string");

    TimeOfDay out;
    out.hour   = to_int(t, 0, 2);
    out.minute = to_int(t, 3, 2);
    if (out.hour > 23 || out.minute > 59)
        invalid(s, "'value' is not a time of day");
    return out;
}

static Count decode_count(Setting s, const json &j)
{
    const json &v = require_field(s, j, "value");
    if (!v.is_number_integer())
        invalid(s, "'value' must be an integer");
    std::int64_t n = v.get<std::int64_t>();
    if (n < 0)
        invalid(s, "'value' must not be negative");
    return Count{ n };
}

static Percent decode_percent(Setting s, const json &j)
{
    return Percent{ require_number(s, require_field(s, j, "value"), "value", 0.0, 100.0) };
}

static UnitSystem decode_units(Setting s, const json &j)
{
    const json &v = require_field(s, j, "value");
    if (v == "imperial")
        return UnitSystem::Imperial;
    if (v == "metric")
        return UnitSystem::Metric;
    invalid(s, "'value' must be \"imperial\" or \"metric\"");
}

static OptionalDate decode_date(Setting s, const json &j)
{
    const json &v = require_field(s, j, "value");
    if (v.is_null())
        return OptionalDate{};
    if (!v.is_string() || !is_date(v.get<std::string>()))
        invalid(s, "'value' must be null or \"YYYY-MM-DD\"");
    return OptionalDate{ v.get<std::string>() };
}

static OptionalInstant decode_instant(Setting s, const json &j)
{
    require_object(s, j);

    if (j.contains("value")) {
        if (!j["value"].is_null())
            invalid(s, "'value' must be null");
        return OptionalInstant{};
    }

    if (j.value("__type__", std::string()) != "datetime")
        invalid(s, "expected {\"__type__\": \"datetime\", ...}");

    const json &iso = require_field(s, j, "iso");
    if (!iso.is_string() || iso.get<std::string>().empty())
        invalid(s, "'iso' must be a non-empty string");

    OptionalInstant out;
    out.iso = iso.get<std::string>();
    out.tz  = "UTC";
    if (j.contains("tz")) {
        if (!j["tz"].is_string())
            invalid(s, "'tz' must be a string");
        out.tz = j["tz"].get<std::string>();
    }
    return out;
}

static TimezoneName decode_timezone(Setting s, const json &j)
{
    const json &v = require_field(s, j, "value");
    if (!v.is_string() || v.get<std::string>().empty())
        invalid(s, "'value' must be a timezone name");
    return TimezoneName{ v.get<std::string>() };
}

static GeoLocation decode_location(Setting s, const json &j)
{
    GeoLocation out;
    out.latitude  = require_number(s, require_field(s, j, "latitude"),  "latitude",  -90.0,  90.0);
    out.longitude = require_number(s, require_field(s, j, "longitude"), "longitude", -180.0, 180.0);
    return out;
}

static SeasonBounds decode_season(Setting s, const json &j)
{
    const json &start = require_field(s, j, "start");
    const json &stop  = require_field(s, j, "stop");
    if (!start.is_string() || !is_month_day(start.get<std::string>()))
        invalid(s, "'start' must be \"MM-DD\"");
    if (!stop.is_string() || !is_month_day(stop.get<std::string>()))
        invalid(s, "'stop' must be \"MM-DD\"");
    return SeasonBounds{ start.get<std::string>(), stop.get<std::string>() };
}

SettingValue decode_setting(Setting s, const json &j)
{
    switch (s) {
    case Setting::HumidityTargetPercent:
    case Setting::MinimumSensorHumidityPercent:
        return decode_zone_percents(s, j);

    case Setting::WateringStartTime:
        return decode_time_of_day(s, j);

    case Setting::WateringMaxMinutesPerZone:
    case Setting::WeatherCheckIntervalSeconds:
    case Setting::WeatherCheckPreWateringSeconds:
    case Setting::SensorReadIntervalSeconds:
    case Setting::TrendMaxSamples:
        return decode_count(s, j);

    case Setting::RainCancelProbabilityThreshold:
        return decode_percent(s, j);

    case Setting::Units:
        return decode_units(s, j);

    case Setting::LastWateringDate:
        return decode_date(s, j);

    case Setting::WeatherLastCheckTimestamp:
        return decode_instant(s, j);

    case Setting::LocalTimezone:
        return decode_timezone(s, j);

    case Setting::Location:
        return decode_location(s, j);

    case Setting::GardeningSeason:
        return decode_season(s, j);
    }
    invalid(s, "unknown setting");
}

// =========================================
// Encoding
// =========================================

struct SettingEncoder {
    json operator()(const ZonePercents &v) const
    {
        json out = json::object();
        for (const auto &kv : v.by_zone)
            out[kv.first] = kv.second;
        return out;
    }

    json operator()(const TimeOfDay &v) const
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", v.hour, v.minute);
        return json{ { "value", buf } };
    }

    json operator()(const Count &v) const { return json{ { "value", v.value } }; }
    json operator()(const Percent &v) const { return json{ { "value", v.value } }; }

    json operator()(const UnitSystem &v) const
    {
        return json{ { "value", v == UnitSystem::Metric ? "metric" : "imperial" } };
    }

    json operator()(const OptionalDate &v) const
    {
        json out;
        out["value"] = v.ymd ? json(*v.ymd) : json(nullptr);
        return out;
    }

    json operator()(const OptionalInstant &v) const
    {
        if (!v.iso)
            return json{ { "value", nullptr } };
        return json{ { "__type__", "datetime" }, { "iso", *v.iso }, { "tz", v.tz } };
    }

    json operator()(const TimezoneName &v) const { return json{ { "value", v.name } }; }

    json operator()(const GeoLocation &v) const
    {
        return json{ { "latitude", v.latitude }, { "longitude", v.longitude } };
    }

    json operator()(const SeasonBounds &v) const
    {
        return json{ { "start", v.start }, { "stop", v.stop } };
    }
};

json encode_setting(const SettingValue &v)
{
    return std::visit(SettingEncoder{}, v);
}

json default_setting(Setting s)
{
    switch (s) {
    case Setting::HumidityTargetPercent:
        return json{ { "Z1", 70.0 }, { "Z2", 70.0 }, { "Z3", 70.0 } };
    case Setting::WateringStartTime:
        return json{ { "value", "20:30" } };
    case Setting::WateringMaxMinutesPerZone:
        return json{ { "value", 10 } };
    case Setting::LastWateringDate:
        return json{ { "value", nullptr } };
    case Setting::RainCancelProbabilityThreshold:
        return json{ { "value", 50.0 } };
    case Setting::Units:
        return json{ { "value", "imperial" } };
    case Setting::WeatherCheckIntervalSeconds:
        return json{ { "value", 6 * 3600 } };
    case Setting::WeatherCheckPreWateringSeconds:
        return json{ { "value", 30 * 60 } };
    case Setting::WeatherLastCheckTimestamp:
        return json{ { "value", nullptr } };
    case Setting::SensorReadIntervalSeconds:
        return json{ { "value", 10 * 60 } };
    case Setting::MinimumSensorHumidityPercent:
        return json{ { "Z1", 30.0 }, { "Z2", 30.0 }, { "Z3", 30.0 } };
    case Setting::TrendMaxSamples:
        return json{ { "value", 3000 } };
    case Setting::LocalTimezone:
        return json{ { "value", "UTC" } };
    case Setting::Location:
        return json{ { "latitude", 0.0 }, { "longitude", 0.0 } };
    case Setting::GardeningSeason:
        return json{ { "start", "03-31" }, { "stop", "10-31" } };
    }
    return json::object();
}

} // namespace waterly
