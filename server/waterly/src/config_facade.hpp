#pragma once

#include "errors.hpp"
#include "settings.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <variant>

namespace waterly {

class Store;

// Typed view of the config table.
class ConfigFacade {
public:
    explicit ConfigFacade(Store &store) : store_(store) {}

    SettingValue get(Setting key) const;

    // Throws NotFoundError if key has no row, ValidationError if the stored
    // value is not a T.
    template <typename T>
    T get(Setting key) const
    {
        SettingValue v = get(key);
        if (!std::holds_alternative<T>(v))
            throw ValidationError(std::string("setting ") + setting_key(key) + " has a different value type");
        return std::get<T>(v);
    }

    // Full overwrite. The value must be the shape this key owns.
    void set(Setting key, const SettingValue &value);

    // Writes the default of every setting without a row. Existing values are
    // left alone. Returns how many rows were written.
    int seed_defaults();

    std::map<std::string, nlohmann::json> all() const;

private:
    Store &store_;
};

} // namespace waterly
