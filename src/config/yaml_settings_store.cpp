// src/config/yaml_settings_store.cpp
#include "config/yaml_settings_store.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>

namespace config {

YamlSettingsStore::YamlSettingsStore(std::string yaml_path, Clock::duration check_interval)
    : path_(std::move(yaml_path)),
      check_interval_(check_interval)
{
}

bool YamlSettingsStore::get_bool(const std::string& key, bool default_val) const {
    refresh();
    auto it = values_.find(key);
    return (it == values_.end()) ? default_val : it->second;
}

void YamlSettingsStore::refresh() const {
    const auto now = Clock::now();
    if (loaded_ && now - last_check_ < check_interval_) return;
    last_check_ = now;

    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        if (!loaded_) {
            LOG_WARN("[YamlSettingsStore] Cannot stat %s: %s", path_.c_str(),
                     ec.message().c_str());
            loaded_ = true;  // stay quiet until the file shows up
        }
        return;
    }
    if (loaded_ && mtime == mtime_) return;

    loaded_ = true;
    mtime_ = mtime;

    try {
        // const lookups never reshape the parsed document
        const YAML::Node root = YAML::LoadFile(path_);
        const YAML::Node settings = root["settings"] ? root["settings"] : root;
        if (!settings.IsMap()) {
            LOG_WARN("[YamlSettingsStore] %s: expected a map, keeping previous values",
                     path_.c_str());
            return;
        }

        std::unordered_map<std::string, bool> fresh;
        for (const auto& kv : settings) {
            const auto key = kv.first.as<std::string>();
            try {
                fresh[key] = kv.second.as<bool>();
            } catch (const YAML::Exception&) {
                LOG_DEBUG("[YamlSettingsStore] Skipping non-boolean key: %s", key.c_str());
            }
        }
        values_.swap(fresh);
        LOG_DEBUG("[YamlSettingsStore] Loaded %zu settings from %s", values_.size(),
                  path_.c_str());
    } catch (const YAML::Exception& e) {
        LOG_WARN("[YamlSettingsStore] Parse error in %s (%s), keeping previous values",
                 path_.c_str(), e.what());
    }
}

} // namespace config
