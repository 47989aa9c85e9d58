#include <unity.h>

#include "errors.hpp"
#include "log.hpp"
#include "store.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <string>

using namespace waterly;
using nlohmann::json;

static std::unique_ptr<Store> g_store;

template <typename E, typename F>
static bool throws(F f)
{
    try {
        f();
    }
    catch (const E &) {
        return true;
    }
    return false;
}

static Zone make_zone(const std::string &name, const std::string &description = "")
{
    Zone z;
    z.name        = name;
    z.description = description;
    return z;
}

static Measurement sample(const std::string &zone, const std::string &metric,
                          std::time_t ts, double reading, const std::string &unit = "%")
{
    Measurement m;
    m.zone    = zone;
    m.name    = metric;
    m.unit    = unit;
    m.ts_utc  = ts;
    m.tz      = std::string("America/Chicago");
    m.reading = reading;
    return m;
}

static Weather fetch(std::time_t hour, std::time_t collected, double temperature)
{
    Weather w;
    w.forecast_ts_utc  = hour;
    w.collected_at_utc = collected;
    w.tz               = std::string("UTC");
    w.temperature_2m   = temperature;
    w.temperature_unit = std::string("°F");
    return w;
}

void setUp(void)
{
    g_store = std::make_unique<Store>(":memory:");
    g_store->upsert_zone(make_zone("Z1", "Zone 1"));
    g_store->upsert_zone(make_zone("Z2", "Zone 2"));
}

void tearDown(void)
{
    g_store.reset();
}

// =========================================
// Zones
// =========================================

void test_upsert_zone_inserts_then_updates(void)
{
    Zone z = make_zone("Z3", "Zone 3");
    z.rh_sensor_address = 12;
    z.relay_address     = 20;

    Zone first = g_store->upsert_zone(z);
    TEST_ASSERT_TRUE(first.id > 0);
    TEST_ASSERT_EQUAL_STRING("Zone 3", first.description.c_str());
    TEST_ASSERT_FALSE(first.npk_sensor_address.has_value());
    TEST_ASSERT_FALSE(first.updated_at.has_value());
    TEST_ASSERT_FALSE(first.created_at.empty());

    z.description        = "Tomatoes";
    z.npk_sensor_address = 33;
    Zone second = g_store->upsert_zone(z);

    TEST_ASSERT_EQUAL_INT((int)first.id, (int)second.id);
    TEST_ASSERT_EQUAL_STRING("Tomatoes", second.description.c_str());
    TEST_ASSERT_EQUAL_INT(33, *second.npk_sensor_address);
    TEST_ASSERT_EQUAL_STRING(first.created_at.c_str(), second.created_at.c_str());
    TEST_ASSERT_TRUE(second.updated_at.has_value());
}

void test_upsert_zone_requires_name(void)
{
    TEST_ASSERT_TRUE(throws<ValidationError>([] { g_store->upsert_zone(make_zone("")); }));
}

void test_zones_are_ordered_by_name(void)
{
    g_store->upsert_zone(make_zone("A0"));

    std::vector<Zone> zones = g_store->zones();
    TEST_ASSERT_EQUAL_INT(3, (int)zones.size());
    TEST_ASSERT_EQUAL_STRING("A0", zones[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("Z1", zones[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("Z2", zones[2].name.c_str());

    TEST_ASSERT_FALSE(g_store->zone("nope").has_value());
}

void test_delete_zone_cascades_measurements(void)
{
    g_store->record_measurement(sample("Z1", "humidity", 1000, 40.0));
    g_store->record_measurement(sample("Z1", "humidity", 2000, 41.0));
    g_store->record_measurement(sample("Z2", "humidity", 2000, 55.0));

    TEST_ASSERT_EQUAL_INT(2, g_store->delete_zone("Z1"));
    TEST_ASSERT_FALSE(g_store->zone("Z1").has_value());
    TEST_ASSERT_EQUAL_INT(0, (int)g_store->measurements("Z1", "humidity", 0, 10000).size());
    TEST_ASSERT_EQUAL_INT(1, (int)g_store->measurements("Z2", "humidity", 0, 10000).size());

    TEST_ASSERT_TRUE(throws<NotFoundError>([] { g_store->delete_zone("Z1"); }));
}

// =========================================
// Measurements
// =========================================

void test_record_measurement_validates_input(void)
{
    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->record_measurement(sample("Z1", "humidity", 1000, 40.0, ""));
    }));
    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->record_measurement(sample("Z1", "", 1000, 40.0));
    }));
    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->record_measurement(sample("Z1", "humidity", 1000, std::nan("")));
    }));
    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->record_measurement(sample("Z1", "humidity", 1000, std::numeric_limits<double>::infinity()));
    }));
    TEST_ASSERT_TRUE(throws<NotFoundError>([] {
        g_store->record_measurement(sample("Z9", "humidity", 1000, 40.0));
    }));

    TEST_ASSERT_EQUAL_INT(0, (int)g_store->measurements("Z1", "humidity", 0, 10000).size());
}

void test_duplicate_sample_rejected(void)
{
    std::int64_t id = g_store->record_measurement(sample("Z1", "humidity", 1000, 40.0));
    TEST_ASSERT_TRUE(id > 0);

    bool rejected = false;
    std::string zone, metric;
    std::time_t ts = 0;
    try {
        g_store->record_measurement(sample("Z1", "humidity", 1000, 99.0));
    }
    catch (const DuplicateSampleError &e) {
        rejected = true;
        zone     = e.zone();
        metric   = e.metric();
        ts       = e.ts_utc();
    }
    TEST_ASSERT_TRUE(rejected);
    TEST_ASSERT_EQUAL_STRING("Z1", zone.c_str());
    TEST_ASSERT_EQUAL_STRING("humidity", metric.c_str());
    TEST_ASSERT_EQUAL_INT(1000, (int)ts);

    std::vector<Measurement> rows = g_store->measurements("Z1", "humidity", 1000, 1000);
    TEST_ASSERT_EQUAL_INT(1, (int)rows.size());
    TEST_ASSERT_FLOAT_WITHIN(0.001, 40.0, rows[0].reading);

    // same timestamp, other metric or zone, is a different sample
    g_store->record_measurement(sample("Z1", "temperature", 1000, 70.0, "°F"));
    g_store->record_measurement(sample("Z2", "humidity", 1000, 50.0));
}

void test_measurements_range_is_inclusive(void)
{
    for (std::time_t ts = 100; ts <= 500; ts += 100)
        g_store->record_measurement(sample("Z1", "humidity", ts, (double)ts / 10.0));

    std::vector<Measurement> rows = g_store->measurements("Z1", "humidity", 200, 400);
    TEST_ASSERT_EQUAL_INT(3, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(200, (int)rows[0].ts_utc);
    TEST_ASSERT_EQUAL_INT(400, (int)rows[2].ts_utc);
    TEST_ASSERT_EQUAL_STRING("Z1", rows[0].zone.c_str());
    TEST_ASSERT_EQUAL_STRING("%", rows[0].unit.c_str());
    TEST_ASSERT_EQUAL_STRING("America/Chicago", rows[0].tz->c_str());
}

void test_latest_candidates_filter_by_zone_and_metric(void)
{
    g_store->record_measurement(sample("Z1", "humidity", 1000, 40.0));
    g_store->record_measurement(sample("Z1", "humidity", 2000, 42.0));
    g_store->record_measurement(sample("Z1", "temperature", 1500, 70.0, "°F"));
    g_store->record_measurement(sample("Z2", "humidity", 500, 60.0));

    std::vector<Measurement> all = g_store->latest_measurement_candidates();
    TEST_ASSERT_EQUAL_INT(3, (int)all.size());
    TEST_ASSERT_EQUAL_STRING("humidity", all[0].name.c_str());
    TEST_ASSERT_EQUAL_INT(2000, (int)all[0].ts_utc);
    TEST_ASSERT_EQUAL_STRING("temperature", all[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("Z2", all[2].zone.c_str());

    std::vector<Measurement> z1h = g_store->latest_measurement_candidates(std::string("Z1"), std::string("humidity"));
    TEST_ASSERT_EQUAL_INT(1, (int)z1h.size());
    TEST_ASSERT_FLOAT_WITHIN(0.001, 42.0, z1h[0].reading);

    std::vector<Measurement> humidity = g_store->latest_measurement_candidates(std::nullopt, std::string("humidity"));
    TEST_ASSERT_EQUAL_INT(2, (int)humidity.size());
}

// =========================================
// Weather
// =========================================

void test_record_weather_accepts_refetch(void)
{
    std::int64_t a = g_store->record_weather(fetch(5000, 100, 60.0));
    std::int64_t b = g_store->record_weather(fetch(5000, 200, 62.0));
    TEST_ASSERT_TRUE(b > a);

    std::vector<Weather> rows = g_store->weather_rows(5000, 5000);
    TEST_ASSERT_EQUAL_INT(2, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(100, (int)rows[0].collected_at_utc);
    TEST_ASSERT_EQUAL_INT(200, (int)rows[1].collected_at_utc);
    TEST_ASSERT_EQUAL_STRING("°F", rows[1].temperature_unit->c_str());
    TEST_ASSERT_FALSE(rows[1].precipitation.has_value());
}

void test_record_weather_validates_units(void)
{
    Weather no_unit = fetch(5000, 100, 60.0);
    no_unit.temperature_unit.reset();
    TEST_ASSERT_TRUE(throws<ValidationError>([&] { g_store->record_weather(no_unit); }));

    Weather bad_value = fetch(5000, 100, std::nan(""));
    TEST_ASSERT_TRUE(throws<ValidationError>([&] { g_store->record_weather(bad_value); }));

    Weather pressure = fetch(5000, 100, 60.0);
    pressure.surface_pressure = 1013.0;
    TEST_ASSERT_TRUE(throws<ValidationError>([&] { g_store->record_weather(pressure); }));
    pressure.pressure_unit = std::string("hPa");
    g_store->record_weather(pressure);

    // probability carries no unit
    Weather chance = fetch(6000, 100, 60.0);
    chance.precipitation_probability = 35.0;
    g_store->record_weather(chance);

    TEST_ASSERT_EQUAL_INT(2, (int)g_store->weather_rows(0, 10000).size());
}

void test_weather_rows_ordered_by_hour_then_collection(void)
{
    g_store->record_weather(fetch(7200, 300, 1.0));
    g_store->record_weather(fetch(3600, 200, 2.0));
    g_store->record_weather(fetch(3600, 100, 3.0));
    g_store->record_weather(fetch(10800, 100, 4.0));

    std::vector<Weather> rows = g_store->weather_rows(3600, 7200);
    TEST_ASSERT_EQUAL_INT(3, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(3600, (int)rows[0].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT(100, (int)rows[0].collected_at_utc);
    TEST_ASSERT_EQUAL_INT(200, (int)rows[1].collected_at_utc);
    TEST_ASSERT_EQUAL_INT(7200, (int)rows[2].forecast_ts_utc);
}

// =========================================
// Config
// =========================================

void test_forecast_rows_limit_distinct_hours(void)
{
    Weather current = fetch(3600, 50, 20.0);
    g_store->record_weather(current);

    for (std::time_t hour : { 3600, 7200, 10800 }) {
        Weather w = fetch(hour, 100, 20.0);
        w.precipitation_probability = 10.0;
        g_store->record_weather(w);
        w.collected_at_utc = 200;
        g_store->record_weather(w);
    }

    // two hours, each fetched twice; the current-conditions row is skipped
    std::vector<Weather> rows = g_store->forecast_rows(3600, 2);
    TEST_ASSERT_EQUAL_INT(4, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(3600, (int)rows[0].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT(100, (int)rows[0].collected_at_utc);
    TEST_ASSERT_EQUAL_INT(3600, (int)rows[1].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT(200, (int)rows[1].collected_at_utc);
    TEST_ASSERT_EQUAL_INT(7200, (int)rows[3].forecast_ts_utc);

    rows = g_store->forecast_rows(10800, -2);
    TEST_ASSERT_EQUAL_INT(4, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(7200, (int)rows[0].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT(10800, (int)rows[3].forecast_ts_utc);

    TEST_ASSERT_EQUAL_INT(0, (int)g_store->forecast_rows(3600, 0).size());
}

void test_config_set_and_get(void)
{
    TEST_ASSERT_FALSE(g_store->get_config(Setting::LocalTimezone).has_value());

    g_store->set_config(Setting::LocalTimezone, json{ { "value", "America/Chicago" } });
    g_store->set_config(Setting::LocalTimezone, json{ { "value", "Europe/Berlin" } });

    std::optional<json> tz = g_store->get_config(Setting::LocalTimezone);
    TEST_ASSERT_TRUE(tz.has_value());
    TEST_ASSERT_EQUAL_STRING("Europe/Berlin", (*tz)["value"].get<std::string>().c_str());

    std::map<std::string, json> all = g_store->all_config();
    TEST_ASSERT_EQUAL_INT(1, (int)all.size());
    TEST_ASSERT_TRUE(all.count("LOCAL_TIMEZONE") == 1);
}

void test_config_rejects_wrong_shape(void)
{
    g_store->set_config(Setting::WateringStartTime, json{ { "value", "06:15" } });

    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->set_config(Setting::WateringStartTime, json{ { "value", 615 } });
    }));
    TEST_ASSERT_TRUE(throws<ValidationError>([] {
        g_store->set_config(Setting::Location, json{ { "latitude", 45.0 } });
    }));

    std::optional<json> start = g_store->get_config(Setting::WateringStartTime);
    TEST_ASSERT_EQUAL_STRING("06:15", (*start)["value"].get<std::string>().c_str());
    TEST_ASSERT_FALSE(g_store->get_config(Setting::Location).has_value());
}

void test_insert_config_if_absent_keeps_existing(void)
{
    TEST_ASSERT_TRUE(g_store->insert_config_if_absent(Setting::Units, json{ { "value", "metric" } }));
    TEST_ASSERT_FALSE(g_store->insert_config_if_absent(Setting::Units, json{ { "value", "imperial" } }));

    std::optional<json> units = g_store->get_config(Setting::Units);
    TEST_ASSERT_EQUAL_STRING("metric", (*units)["value"].get<std::string>().c_str());
}

void test_store_records_builtin_migrations(void)
{
    std::vector<MigrationRecord> h = g_store->migration_history();
    TEST_ASSERT_EQUAL_INT(2, (int)h.size());
    TEST_ASSERT_EQUAL_STRING("1.0.0", h[0].version->c_str());
    TEST_ASSERT_EQUAL_STRING("1.0.1", h[1].version->c_str());
    TEST_ASSERT_EQUAL_INT(64, (int)h[0].checksum.size());
}

int main(void)
{
    Logger::init(stderr, LogLevel::WARN);

    UNITY_BEGIN();
    RUN_TEST(test_upsert_zone_inserts_then_updates);
    RUN_TEST(test_upsert_zone_requires_name);
    RUN_TEST(test_zones_are_ordered_by_name);
    RUN_TEST(test_delete_zone_cascades_measurements);
    RUN_TEST(test_record_measurement_validates_input);
    RUN_TEST(test_duplicate_sample_rejected);
    RUN_TEST(test_measurements_range_is_inclusive);
    RUN_TEST(test_latest_candidates_filter_by_zone_and_metric);
    RUN_TEST(test_record_weather_accepts_refetch);
    RUN_TEST(test_record_weather_validates_units);
    RUN_TEST(test_weather_rows_ordered_by_hour_then_collection);
    RUN_TEST(test_forecast_rows_limit_distinct_hours);
    RUN_TEST(test_config_set_and_get);
    RUN_TEST(test_config_rejects_wrong_shape);
    RUN_TEST(test_insert_config_if_absent_keeps_existing);
    RUN_TEST(test_store_records_builtin_migrations);
    return UNITY_END();
}
