#include "resolver.hpp"
#include "errors.hpp"
#include "store.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <utility>

namespace waterly {

// =========================================
// Reducers
// =========================================

std::vector<Measurement> reduce_latest_measurements(const std::vector<Measurement> &rows)
{
    std::map<std::pair<std::string, std::string>, Measurement> best;

    for (const auto &m : rows) {
        auto key = std::make_pair(m.zone, m.name);
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(key, m);
            continue;
        }
        const Measurement &cur = it->second;
        if (m.ts_utc > cur.ts_utc || (m.ts_utc == cur.ts_utc && m.id > cur.id))
            it->second = m;
    }

    std::vector<Measurement> out;
    out.reserve(best.size());
    for (auto &kv : best)
        out.push_back(kv.second);
    return out;
}

std::vector<Weather> reduce_latest_weather(const std::vector<Weather> &rows)
{
    std::map<std::time_t, Weather> best;

    for (const auto &w : rows) {
        auto it = best.find(w.forecast_ts_utc);
        if (it == best.end()) {
            best.emplace(w.forecast_ts_utc, w);
            continue;
        }
        const Weather &cur = it->second;
        if (w.collected_at_utc > cur.collected_at_utc ||
            (w.collected_at_utc == cur.collected_at_utc && w.id > cur.id))
            it->second = w;
    }

    std::vector<Weather> out;
    out.reserve(best.size());
    for (auto &kv : best)
        out.push_back(kv.second);
    return out;
}

std::vector<ZoneLatest> join_latest_by_zone(const std::vector<Zone> &zones,
                                            const std::vector<Measurement> &latest)
{
    std::map<std::string, ZoneLatest> joined;
    for (const auto &z : zones)
        joined[z.name].zone = z;

    // reduce first so each (zone, metric) contributes once, in metric order
    for (const auto &m : reduce_latest_measurements(latest)) {
        auto it = joined.find(m.zone);
        if (it != joined.end())
            it->second.metrics.push_back(m);
    }

    std::vector<ZoneLatest> out;
    out.reserve(joined.size());
    for (auto &kv : joined)
        out.push_back(std::move(kv.second));
    return out;
}

// =========================================
// Store-backed queries
// =========================================

std::optional<Measurement> latest_measurement(const Store &store,
                                              const std::string &zone,
                                              const std::string &metric)
{
    std::vector<Measurement> rows =
        reduce_latest_measurements(store.latest_measurement_candidates(zone, metric));
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::vector<Measurement> latest_measurements(const Store &store)
{
    return reduce_latest_measurements(store.latest_measurement_candidates());
}

std::vector<ZoneLatest> latest_by_zone(const Store &store)
{
    return join_latest_by_zone(store.zones(), store.latest_measurement_candidates());
}

std::optional<Weather> latest_weather(const Store &store, std::time_t forecast_hour)
{
    std::vector<Weather> rows =
        reduce_latest_weather(store.weather_rows(forecast_hour, forecast_hour));
    if (rows.empty())
        return std::nullopt;
    return rows.front();
}

std::vector<Weather> latest_weather(const Store &store)
{
    return reduce_latest_weather(store.weather_rows(std::numeric_limits<std::time_t>::min(),
                                                    std::numeric_limits<std::time_t>::max()));
}

std::vector<Weather> forecast_hours(const Store &store, std::time_t from, int count)
{
    std::vector<Weather> rows = reduce_latest_weather(store.forecast_rows(from, count));
    if (count < 0)
        std::reverse(rows.begin(), rows.end());
    return rows;
}

std::vector<Weather> weather_window(const Store &store,
                                    std::time_t now,
                                    std::time_t before,
                                    std::time_t after)
{
    if (before < 0 || after < 0)
        throw ValidationError("weather window durations must not be negative");
    if (now < std::numeric_limits<std::time_t>::min() + before ||
        now > std::numeric_limits<std::time_t>::max() - after)
        throw ValidationError("weather window reaches past the representable time range");

    return reduce_latest_weather(store.weather_rows(now - before, now + after));
}

} // namespace waterly
