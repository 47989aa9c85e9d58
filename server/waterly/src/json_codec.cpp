#include "json_codec.hpp"

using nlohmann::json;

namespace waterly {

template <typename T>
static json opt(const std::optional<T> &v)
{
    return v ? json(*v) : json(nullptr);
}

void to_json(json &j, const Zone &z)
{
    j = json{
        { "id",                 z.id },
        { "name",               z.name },
        { "description",        z.description },
        { "rh_sensor_address",  opt(z.rh_sensor_address) },
        { "npk_sensor_address", opt(z.npk_sensor_address) },
        { "relay_address",      opt(z.relay_address) },
        { "created_at",         z.created_at },
        { "updated_at",         opt(z.updated_at) },
    };
}

void to_json(json &j, const Measurement &m)
{
    j = json{
        { "id",         m.id },
        { "zone",       m.zone },
        { "name",       m.name },
        { "unit",       m.unit },
        { "ts_utc",     (long long)m.ts_utc },
        { "tz",         opt(m.tz) },
        { "reading",    m.reading },
        { "created_at", m.created_at },
    };
}

void to_json(json &j, const Weather &w)
{
    j = json{
        { "id",                        w.id },
        { "collected_at_utc",          (long long)w.collected_at_utc },
        { "forecast_ts_utc",           (long long)w.forecast_ts_utc },
        { "tz",                        opt(w.tz) },
        { "tag",                       opt(w.tag) },
        { "temperature_2m",            opt(w.temperature_2m) },
        { "temperature_unit",          opt(w.temperature_unit) },
        { "precipitation_probability", opt(w.precipitation_probability) },
        { "precipitation",             opt(w.precipitation) },
        { "precipitation_unit",        opt(w.precipitation_unit) },
        { "soil_moisture_1_to_3cm",    opt(w.soil_moisture_1_to_3cm) },
        { "moisture_unit",             opt(w.moisture_unit) },
        { "surface_pressure",          opt(w.surface_pressure) },
        { "pressure_unit",             opt(w.pressure_unit) },
        { "created_at",                w.created_at },
    };
}

// {"zone": {...}, "metrics": {"humidity": {...}, ...}}
void to_json(json &j, const ZoneLatest &zl)
{
    json metrics = json::object();
    for (const auto &m : zl.metrics)
        metrics[m.name] = m;

    j = json{
        { "zone",    zl.zone },
        { "metrics", metrics },
    };
}

void to_json(json &j, const MigrationRecord &r)
{
    j = json{
        { "installed_rank", r.installed_rank },
        { "version",        opt(r.version) },
        { "description",    r.description },
        { "checksum",       r.checksum },
        { "installed_on",   r.installed_on },
    };
}

} // namespace waterly
