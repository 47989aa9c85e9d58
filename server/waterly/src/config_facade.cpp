#include "config_facade.hpp"
#include "log.hpp"
#include "store.hpp"

using nlohmann::json;

namespace waterly {

SettingValue ConfigFacade::get(Setting key) const
{
    std::optional<json> stored = store_.get_config(key);
    if (!stored)
        throw NotFoundError(std::string("setting not configured: ") + setting_key(key));
    return decode_setting(key, *stored);
}

void ConfigFacade::set(Setting key, const SettingValue &value)
{
    json encoded = encode_setting(value);

    if (decode_setting(key, encoded).index() != value.index())
        throw ValidationError(std::string("setting ") + setting_key(key) + " does not take this value type");

    store_.set_config(key, encoded);
}

int ConfigFacade::seed_defaults()
{
    int written = 0;
    for (Setting s : all_settings()) {
        if (store_.insert_config_if_absent(s, default_setting(s))) {
            Logger::debug("seeded default for %s", setting_key(s));
            ++written;
        }
    }

    if (written > 0)
        Logger::info("seeded %d default setting(s)", written);
    return written;
}

std::map<std::string, json> ConfigFacade::all() const
{
    return store_.all_config();
}

} // namespace waterly
