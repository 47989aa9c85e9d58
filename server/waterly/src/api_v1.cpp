#include "api_v1.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "log.hpp"
#include "resolver.hpp"
#include "store.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <string>

using nlohmann::json;
using namespace waterly;

static constexpr int DEFAULT_FORECAST_HOURS = 12;
static constexpr int MAX_FORECAST_HOURS     = 240;

// ----------------- query helpers -----------------

// Integer parameter. Returns false if absent; throws ValidationError if
// present but not an integer.
static bool get_query_time(const api_v1::QueryLookup &query, const char *name, std::time_t &out)
{
    const char *val = query(name);
    if (!val || !*val)
        return false;

    char *end = nullptr;
    errno = 0;
    long long v = std::strtoll(val, &end, 10);
    if (end == val || *end != '\0' || errno == ERANGE)
        throw ValidationError(std::string("query parameter '") + name + "' must be an integer");

    out = static_cast<std::time_t>(v);
    return true;
}

static std::string require_query(const api_v1::QueryLookup &query, const char *name)
{
    const char *val = query(name);
    if (!val || !*val)
        throw ValidationError(std::string("query parameter '") + name + "' is required");
    return val;
}

static api_v1::Reply error_reply(unsigned int status, const char *error, const std::string &message)
{
    json body{ { "error", error }, { "message", message } };
    return api_v1::Reply{ status, body.dump() };
}

// ----------------- endpoints -----------------

static json measurement_latest_json(const Store &store, const api_v1::QueryLookup &query)
{
    std::string zone   = require_query(query, "zone");
    std::string metric = require_query(query, "metric");

    std::optional<Measurement> m = latest_measurement(store, zone, metric);
    if (!m)
        throw NotFoundError("no " + metric + " measurement for zone " + zone);
    return json(*m);
}

static json weather_latest_json(const Store &store, const api_v1::QueryLookup &query)
{
    std::time_t hour = 0;
    if (!get_query_time(query, "hour", hour))
        return json(latest_weather(store));

    std::optional<Weather> w = latest_weather(store, hour);
    if (!w)
        throw NotFoundError("no forecast for hour " + utils::format_utc(hour));
    return json(*w);
}

static json weather_window_json(const Store &store, const api_v1::QueryLookup &query)
{
    std::time_t before = DEFAULT_WINDOW_SECONDS;
    std::time_t after  = DEFAULT_WINDOW_SECONDS;
    get_query_time(query, "before", before);
    get_query_time(query, "after", after);

    std::time_t now = std::time(nullptr);

    json out;
    out["now"]     = (long long)now;
    out["now_utc"] = utils::format_utc(now);
    out["before"]  = (long long)before;
    out["after"]   = (long long)after;
    out["rows"]    = weather_window(store, now, before, after);
    return out;
}

static json weather_forecast_json(const Store &store, const api_v1::QueryLookup &query)
{
    std::time_t from  = std::time(nullptr);
    std::time_t count = DEFAULT_FORECAST_HOURS;
    get_query_time(query, "from", from);
    get_query_time(query, "count", count);

    if (count < -MAX_FORECAST_HOURS || count > MAX_FORECAST_HOURS)
        throw ValidationError("query parameter 'count' must be within +/-" + std::to_string(MAX_FORECAST_HOURS));

    json out;
    out["from"]  = (long long)from;
    out["count"] = (long long)count;
    out["rows"]  = forecast_hours(store, from, static_cast<int>(count));
    return out;
}

static json config_json(const Store &store)
{
    json out = json::object();
    for (const auto &kv : store.all_config())
        out[kv.first] = kv.second;
    return out;
}

static json dispatch(const Store &store, const char *url, const api_v1::QueryLookup &query)
{
    if (std::strcmp(url, "/api/v1/zones") == 0)
        return json(store.zones());
    if (std::strcmp(url, "/api/v1/zones/latest") == 0)
        return json(latest_by_zone(store));
    if (std::strcmp(url, "/api/v1/measurement/latest") == 0)
        return measurement_latest_json(store, query);
    if (std::strcmp(url, "/api/v1/weather/latest") == 0)
        return weather_latest_json(store, query);
    if (std::strcmp(url, "/api/v1/weather/window") == 0)
        return weather_window_json(store, query);
    if (std::strcmp(url, "/api/v1/weather/forecast") == 0)
        return weather_forecast_json(store, query);
    if (std::strcmp(url, "/api/v1/config") == 0)
        return config_json(store);
    if (std::strcmp(url, "/api/v1/migrations") == 0)
        return json(store.migration_history());

    throw NotFoundError(std::string("unknown endpoint ") + url);
}

// ----------------- api_v1 -----------------

api_v1::Reply api_v1::guarded(const char *url, const std::function<json()> &body)
{
    try {
        return Reply{ HTTP_OK, body().dump() };
    }
    catch (const NotFoundError &e) {
        return error_reply(HTTP_NOT_FOUND, "not_found", e.what());
    }
    catch (const ValidationError &e) {
        return error_reply(HTTP_BAD_REQUEST, "validation", e.what());
    }
    catch (const StoreError &e) {
        Logger::error("GET %s failed: %s", url, e.what());
        return error_reply(HTTP_INTERNAL_ERROR, "storage", e.what());
    }
    catch (const json::exception &e) {
        Logger::error("GET %s: cannot encode response: %s", url, e.what());
        return error_reply(HTTP_INTERNAL_ERROR, "internal", e.what());
    }
    catch (const std::exception &e) {
        Logger::error("GET %s: %s", url, e.what());
        return error_reply(HTTP_INTERNAL_ERROR, "internal", e.what());
    }
}

api_v1::Reply api_v1::handle(const Store &store,
                             const char *url,
                             const char *method,
                             const QueryLookup &query)
{
    // Browser preflight: empty body, CORS headers only
    if (std::strcmp(method, "OPTIONS") == 0)
        return Reply{ HTTP_NO_CONTENT, "" };

    if (std::strcmp(method, "GET") != 0) {
        return error_reply(HTTP_METHOD_NOT_ALLOWED, "method_not_allowed",
                           std::string(method) + " is not supported");
    }

    return guarded(url, [&] { return dispatch(store, url, query); });
}
