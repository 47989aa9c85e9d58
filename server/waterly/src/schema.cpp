#include "schema.hpp"

namespace waterly {

// =========================================
// 1.0.0 core schema
// =========================================

static const char *CORE_SCHEMA_V1_0_0 = R"SQL(
-- Zones: human-friendly name + hardware addresses (nullable if not present)
CREATE TABLE zone (
  id                   INTEGER PRIMARY KEY,
  name                 TEXT NOT NULL UNIQUE,
  description          TEXT,
  rh_sensor_address    INTEGER,
  npk_sensor_address   INTEGER,
  relay_address        INTEGER,
  created_at           TEXT NOT NULL DEFAULT (datetime('now')),
  updated_at           TEXT
);

CREATE TRIGGER trg_zone_updated_at
AFTER UPDATE ON zone
FOR EACH ROW
BEGIN
  UPDATE zone SET updated_at = datetime('now') WHERE id = NEW.id;
END;

CREATE TRIGGER trg_zone_name_immutable
BEFORE UPDATE OF name ON zone
FOR EACH ROW
WHEN NEW.name <> OLD.name
BEGIN
  SELECT RAISE(ABORT, 'zone name is immutable');
END;

-- Measurements: one scalar reading per zone, metric and UTC second
CREATE TABLE measurement (
  id          INTEGER PRIMARY KEY,
  zone_id     INTEGER NOT NULL,
  name        TEXT NOT NULL,
  unit        TEXT NOT NULL,
  ts_utc      INTEGER NOT NULL,
  tz          TEXT,
  reading     REAL NOT NULL,
  created_at  TEXT NOT NULL DEFAULT (datetime('now')),

  FOREIGN KEY (zone_id) REFERENCES zone(id) ON DELETE CASCADE,
  UNIQUE (zone_id, name, ts_utc)
);

CREATE INDEX idx_measurement_zone_ts      ON measurement (zone_id, ts_utc);
CREATE INDEX idx_measurement_zone_name_ts ON measurement (zone_id, name, ts_utc);
CREATE INDEX idx_measurement_name_ts      ON measurement (name, ts_utc);

-- Config: one row per setting, value is JSON
CREATE TABLE config (
  type   TEXT PRIMARY KEY,
  value  TEXT NOT NULL CHECK (json_valid(value))
) WITHOUT ROWID;

-- Weather: hourly forecasts with explicit units per field
CREATE TABLE weather (
  id                           INTEGER PRIMARY KEY,
  collected_at_utc             INTEGER NOT NULL,
  forecast_ts_utc              INTEGER NOT NULL,
  tz                           TEXT,
  tag                          TEXT,
  temperature_2m               REAL,
  temperature_unit             TEXT,
  precipitation_probability    REAL,
  precipitation                REAL,
  precipitation_unit           TEXT,
  soil_moisture_1_to_3cm       REAL,
  moisture_unit                TEXT,
  surface_pressure             REAL,
  pressure_unit                TEXT,
  created_at                   TEXT NOT NULL DEFAULT (datetime('now')),

  UNIQUE (forecast_ts_utc)
);

CREATE INDEX idx_weather_forecast_ts  ON weather (forecast_ts_utc);
CREATE INDEX idx_weather_collected_ts ON weather (collected_at_utc);

-- Latest measurement per zone and metric
CREATE VIEW v_latest_measurement AS
SELECT m.*
FROM measurement m
JOIN (
  SELECT zone_id, name, MAX(ts_utc) AS max_ts
  FROM measurement
  GROUP BY zone_id, name
) t
ON t.zone_id = m.zone_id AND t.name = m.name AND t.max_ts = m.ts_utc;

-- Latest measurement per zone for all metrics; zones without data included
CREATE VIEW v_latest_by_zone AS
SELECT z.id   AS zone_id,
       z.name AS zone_name,
       m.name AS metric_name,
       m.unit,
       m.reading,
       m.ts_utc,
       m.tz
FROM zone z
LEFT JOIN v_latest_measurement m
  ON m.zone_id = z.id;
)SQL";

// =========================================
// 1.0.1 weather re-fetch
// =========================================

// The collector re-fetches near-term hours; keep every fetch and let readers
// resolve the latest one.
static const char *WEATHER_REFETCH_V1_0_1 = R"SQL(
CREATE TABLE weather_new (
  id                           INTEGER PRIMARY KEY,
  collected_at_utc             INTEGER NOT NULL,
  forecast_ts_utc              INTEGER NOT NULL,
  tz                           TEXT,
  tag                          TEXT,
  temperature_2m               REAL,
  temperature_unit             TEXT,
  precipitation_probability    REAL,
  precipitation                REAL,
  precipitation_unit           TEXT,
  soil_moisture_1_to_3cm       REAL,
  moisture_unit                TEXT,
  surface_pressure             REAL,
  pressure_unit                TEXT,
  created_at                   TEXT NOT NULL DEFAULT (datetime('now'))
);

INSERT INTO weather_new
SELECT id, collected_at_utc, forecast_ts_utc, tz, tag,
       temperature_2m, temperature_unit, precipitation_probability,
       precipitation, precipitation_unit,
       soil_moisture_1_to_3cm, moisture_unit,
       surface_pressure, pressure_unit, created_at
FROM weather;

DROP TABLE weather;
ALTER TABLE weather_new RENAME TO weather;

CREATE INDEX idx_weather_forecast_ts           ON weather (forecast_ts_utc);
CREATE INDEX idx_weather_collected_ts          ON weather (collected_at_utc);
CREATE INDEX idx_weather_forecast_collected_ts ON weather (forecast_ts_utc, collected_at_utc);

-- Latest fetch per forecast hour
CREATE VIEW v_latest_weather AS
SELECT w.*
FROM weather w
WHERE w.id = (
  SELECT x.id
  FROM weather x
  WHERE x.forecast_ts_utc = w.forecast_ts_utc
  ORDER BY x.collected_at_utc DESC, x.id DESC
  LIMIT 1
);
)SQL";

// =========================================
// 1.1.0 default zones
// =========================================

static const char *DEFAULT_ZONES_V1_1_0 = R"SQL(
INSERT INTO zone(name, description, rh_sensor_address, npk_sensor_address, relay_address)
  VALUES ('Z1', 'Zone 1', 10, NULL, 19)
  ON CONFLICT(name) DO NOTHING;
INSERT INTO zone(name, description, rh_sensor_address, npk_sensor_address, relay_address)
  VALUES ('Z2', 'Zone 2', 11, 32, 16)
  ON CONFLICT(name) DO NOTHING;
INSERT INTO zone(name, description, rh_sensor_address, npk_sensor_address, relay_address)
  VALUES ('Z3', 'Zone 3', 12, NULL, 20)
  ON CONFLICT(name) DO NOTHING;
INSERT INTO zone(name, description, rh_sensor_address, npk_sensor_address, relay_address)
  VALUES ('RPI', 'Raspberry PI Zero 2W', NULL, NULL, NULL)
  ON CONFLICT(name) DO NOTHING;
)SQL";

const std::vector<Migration> &builtin_migrations()
{
    static const std::vector<Migration> migrations = {
        make_migration(std::string("1.0.0"), "Core schema", CORE_SCHEMA_V1_0_0),
        make_migration(std::string("1.0.1"), "Weather re-fetch per forecast hour", WEATHER_REFETCH_V1_0_1),
    };
    return migrations;
}

const std::vector<Migration> &provisioning_migrations()
{
    static const std::vector<Migration> migrations = {
        make_migration(std::string("1.1.0"), "Default zones", DEFAULT_ZONES_V1_1_0),
    };
    return migrations;
}

} // namespace waterly
