#pragma once

#include "migration.hpp"
#include "model.hpp"

#include <nlohmann/json.hpp>

// JSON views of store rows, used by the HTTP API. Optional fields that are
// empty serialise as null.
namespace waterly {

void to_json(nlohmann::json &j, const Zone &z);
void to_json(nlohmann::json &j, const Measurement &m);
void to_json(nlohmann::json &j, const Weather &w);
void to_json(nlohmann::json &j, const ZoneLatest &zl);
void to_json(nlohmann::json &j, const MigrationRecord &r);

} // namespace waterly
