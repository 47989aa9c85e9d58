#include <unity.h>

#include "errors.hpp"
#include "log.hpp"
#include "resolver.hpp"
#include "store.hpp"

#include <limits>
#include <memory>

using namespace waterly;

static std::unique_ptr<Store> g_store;

static const std::time_t NOW = 1000000;

static void fetch(std::time_t hour, std::time_t collected, double temperature)
{
    Weather w;
    w.forecast_ts_utc  = hour;
    w.collected_at_utc = collected;
    w.temperature_2m   = temperature;
    w.temperature_unit = std::string("°C");
    g_store->record_weather(w);
}

void setUp(void)
{
    g_store = std::make_unique<Store>(":memory:");
}

void tearDown(void)
{
    g_store.reset();
}

void test_window_bounds_are_inclusive(void)
{
    fetch(NOW - 3601, 1, 1.0);
    fetch(NOW - 3600, 1, 2.0);
    fetch(NOW,        1, 3.0);
    fetch(NOW + 3600, 1, 4.0);
    fetch(NOW + 3601, 1, 5.0);

    std::vector<Weather> rows = weather_window(*g_store, NOW, 3600, 3600);
    TEST_ASSERT_EQUAL_INT(3, (int)rows.size());
    TEST_ASSERT_EQUAL_INT((int)(NOW - 3600), (int)rows[0].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT((int)NOW, (int)rows[1].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT((int)(NOW + 3600), (int)rows[2].forecast_ts_utc);
}

void test_window_defaults_to_twelve_hours(void)
{
    fetch(NOW - 12 * 3600 - 1, 1, 0.0);
    fetch(NOW - 12 * 3600,     1, 1.0);
    fetch(NOW + 12 * 3600,     1, 2.0);
    fetch(NOW + 12 * 3600 + 1, 1, 3.0);
    fetch(NOW + 13 * 3600,     1, 4.0);

    std::vector<Weather> rows = weather_window(*g_store, NOW);
    TEST_ASSERT_EQUAL_INT(2, (int)rows.size());
    TEST_ASSERT_EQUAL_INT((int)(NOW - 12 * 3600), (int)rows[0].forecast_ts_utc);
    TEST_ASSERT_EQUAL_INT((int)(NOW + 12 * 3600), (int)rows[1].forecast_ts_utc);
}

void test_window_resolves_refetches(void)
{
    fetch(NOW, 100, 10.0);
    fetch(NOW, 300, 30.0);
    fetch(NOW, 200, 20.0);
    fetch(NOW + 3600, 100, 40.0);

    std::vector<Weather> rows = weather_window(*g_store, NOW, 0, 3600);
    TEST_ASSERT_EQUAL_INT(2, (int)rows.size());
    TEST_ASSERT_EQUAL_INT(300, (int)rows[0].collected_at_utc);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 30.0, *rows[0].temperature_2m);
    TEST_ASSERT_EQUAL_INT((int)(NOW + 3600), (int)rows[1].forecast_ts_utc);
}

void test_window_tracks_new_fetches(void)
{
    fetch(NOW, 100, 10.0);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 10.0, *weather_window(*g_store, NOW, 0, 0)[0].temperature_2m);

    fetch(NOW, 200, 12.0);
    TEST_ASSERT_FLOAT_WITHIN(0.001, 12.0, *weather_window(*g_store, NOW, 0, 0)[0].temperature_2m);
}

void test_window_rejects_negative_durations(void)
{
    bool before_rejected = false;
    try {
        weather_window(*g_store, NOW, -1, 3600);
    }
    catch (const ValidationError &) {
        before_rejected = true;
    }

    bool after_rejected = false;
    try {
        weather_window(*g_store, NOW, 3600, -1);
    }
    catch (const ValidationError &) {
        after_rejected = true;
    }

    TEST_ASSERT_TRUE(before_rejected);
    TEST_ASSERT_TRUE(after_rejected);
}

void test_window_rejects_overflowing_durations(void)
{
    const std::time_t huge = std::numeric_limits<std::time_t>::max();
    fetch(NOW, 1, 1.0);

    bool after_rejected = false;
    try {
        weather_window(*g_store, NOW, 0, huge);
    }
    catch (const ValidationError &) {
        after_rejected = true;
    }

    bool before_rejected = false;
    try {
        weather_window(*g_store, NOW, huge, 0);
    }
    catch (const ValidationError &) {
        before_rejected = true;
    }

    TEST_ASSERT_TRUE(after_rejected);
    TEST_ASSERT_TRUE(before_rejected);

    // the widest window that stays in range still resolves
    std::vector<Weather> rows = weather_window(*g_store, NOW, NOW, huge - NOW);
    TEST_ASSERT_EQUAL_INT(1, (int)rows.size());
}

void test_empty_window(void)
{
    fetch(NOW + 7200, 1, 1.0);
    TEST_ASSERT_EQUAL_INT(0, (int)weather_window(*g_store, NOW, 3600, 3600).size());
}

int main(void)
{
    Logger::init(stderr, LogLevel::WARN);

    UNITY_BEGIN();
    RUN_TEST(test_window_bounds_are_inclusive);
    RUN_TEST(test_window_defaults_to_twelve_hours);
    RUN_TEST(test_window_resolves_refetches);
    RUN_TEST(test_window_tracks_new_fetches);
    RUN_TEST(test_window_rejects_negative_durations);
    RUN_TEST(test_window_rejects_overflowing_durations);
    RUN_TEST(test_empty_window);
    return UNITY_END();
}
