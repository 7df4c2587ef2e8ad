// src/config/yaml_settings_store.hpp
#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "config/settings_provider.hpp"

namespace config {

/**
 * YamlSettingsStore - File-backed settings, flat "key: value" map
 *
 * Example file:
 *   settings:
 *     reverse_acc_change: true
 *
 * The modification time is checked at most once per check_interval, and
 * the file is re-parsed only when it changed. A file that disappears or
 * fails to parse leaves the last good values in place.
 */
class YamlSettingsStore : public SettingsProvider {
public:
    using Clock = std::chrono::steady_clock;

    explicit YamlSettingsStore(std::string yaml_path,
                               Clock::duration check_interval = std::chrono::seconds(1));

    bool get_bool(const std::string& key, bool default_val = false) const override;

    // Force a re-read on the next lookup
    void invalidate() { loaded_ = false; }

    const std::string& path() const { return path_; }

private:
    void refresh() const;

    std::string path_;
    Clock::duration check_interval_;

    // Lookups are logically const; the cache refreshes underneath
    mutable bool loaded_ = false;
    mutable Clock::time_point last_check_{};
    mutable std::filesystem::file_time_type mtime_{};
    mutable std::unordered_map<std::string, bool> values_;
};

} // namespace config
