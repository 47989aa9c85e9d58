#pragma once

#include "model.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace waterly {

class Store;

// =========================================
// Reducers (no storage)
// =========================================

// Keeps the max-ts_utc row per (zone, metric). Output ordered by zone then
// metric. A tie on ts_utc keeps the higher id.
std::vector<Measurement> reduce_latest_measurements(const std::vector<Measurement> &rows);

// Keeps the max-collected_at_utc row per forecast hour, ascending by forecast
// hour. A tie on collected_at_utc keeps the higher id.
std::vector<Weather> reduce_latest_weather(const std::vector<Weather> &rows);

// Left join: every zone appears, with whichever latest rows belong to it.
// Zones ordered by name, metrics by metric name.
std::vector<ZoneLatest> join_latest_by_zone(const std::vector<Zone> &zones,
                                            const std::vector<Measurement> &latest);

// =========================================
// Store-backed queries
// =========================================

std::optional<Measurement> latest_measurement(const Store &store,
                                              const std::string &zone,
                                              const std::string &metric);

std::vector<Measurement> latest_measurements(const Store &store);

std::vector<ZoneLatest> latest_by_zone(const Store &store);

std::optional<Weather> latest_weather(const Store &store, std::time_t forecast_hour);

// One resolved row per forecast hour, ascending.
std::vector<Weather> latest_weather(const Store &store);

// Resolved forecast rows for the next `count` forecast hours at or after
// `from` (positive count, ascending), or the previous |count| hours at or
// before it (negative count, descending). Current-conditions rows, which
// carry no precipitation probability, are skipped.
std::vector<Weather> forecast_hours(const Store &store, std::time_t from, int count);

static constexpr std::time_t DEFAULT_WINDOW_SECONDS = 12 * 60 * 60;

// Resolved forecast rows with forecast hour in [now - before, now + after].
// Throws ValidationError on a negative duration or one that leaves the
// time_t range.
std::vector<Weather> weather_window(const Store &store,
                                    std::time_t now,
                                    std::time_t before = DEFAULT_WINDOW_SECONDS,
                                    std::time_t after  = DEFAULT_WINDOW_SECONDS);

} // namespace waterly
