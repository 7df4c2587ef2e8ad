// src/config/settings_provider.hpp
#pragma once

#include <string>
#include <unordered_map>

namespace config {

// Flip which press (short or long) gets the coarse interval
constexpr const char* kReverseAccChangeKey = "reverse_acc_change";

/**
 * SettingsProvider - Read-only view of the runtime key-value settings
 *
 * Read every control cycle, so implementations must be cheap and must not
 * throw. Unknown keys return the default.
 */
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;

    virtual bool get_bool(const std::string& key, bool default_val = false) const = 0;
};

/**
 * MemorySettingsStore - Fixed in-process values (tests, tools)
 */
class MemorySettingsStore : public SettingsProvider {
public:
    bool get_bool(const std::string& key, bool default_val = false) const override {
        auto it = values_.find(key);
        return (it == values_.end()) ? default_val : it->second;
    }

    void set_bool(const std::string& key, bool value) { values_[key] = value; }

private:
    std::unordered_map<std::string, bool> values_;
};

} // namespace config
