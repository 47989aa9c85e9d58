#pragma once

#include <ctime>
#include <stdexcept>
#include <string>

namespace waterly {

// Base of every error the store reports to its callers.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed input, rejected before anything is written.
class ValidationError : public StoreError {
public:
    using StoreError::StoreError;
};

// Absent zone or config row where the call requires one.
class NotFoundError : public StoreError {
public:
    using StoreError::StoreError;
};

// Checksum/version conflict or a failed migration script. Fatal at startup.
class MigrationError : public StoreError {
public:
    using StoreError::StoreError;
};

// Any other SQLite failure (open, prepare, step).
class StorageError : public StoreError {
public:
    using StoreError::StoreError;
};

// A second reading for the same (zone, metric, ts_utc).
class DuplicateSampleError : public StoreError {
public:
    DuplicateSampleError(const std::string &zone,
                         const std::string &metric,
                         std::time_t ts_utc)
        : StoreError("duplicate sample for zone '" + zone + "', metric '" +
                     metric + "' at " + std::to_string((long long)ts_utc)),
          zone_(zone),
          metric_(metric),
          ts_utc_(ts_utc)
    {
    }

    const std::string &zone() const { return zone_; }
    const std::string &metric() const { return metric_; }
    std::time_t ts_utc() const { return ts_utc_; }

private:
    std::string zone_;
    std::string metric_;
    std::time_t ts_utc_;
};

} // namespace waterly
