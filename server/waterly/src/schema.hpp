#pragma once

#include "migration.hpp"

#include <vector>

namespace waterly {

// The store's own schema history, oldest first. Never edit a shipped entry:
// a changed script under an applied version is reported as drift.
const std::vector<Migration> &builtin_migrations();

// Seed data for a fresh field deployment (default zones).
const std::vector<Migration> &provisioning_migrations();

}
