/**
 * Settings.hpp - Persisted user settings (voice, rate, volume, visibility)
 *
 * Stored as JSON under the user's config directory. Reading never fails:
 * a missing or corrupt record yields the defaults. Writing is best-effort.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ttsr::config {

constexpr int kMinRate = -10;
constexpr int kMaxRate = 10;
constexpr unsigned kMaxVolume = 100;

struct Settings {
    std::string voice_name;     // Display identifier, empty = first available voice
    int rate = 0;               // -10..10
    unsigned volume = 100;      // 0..100
    bool hidden = false;        // Start without the front-end

    bool operator==(const Settings&) const = default;
};

int clampRate(int rate);
unsigned clampVolume(unsigned volume);

/**
 * Clamp rate and volume into their valid ranges.
 */
Settings sanitize(Settings settings);

class SettingsStore {
public:
    /**
     * @param app_id      Application identifier, used as the directory name
     * @param key         Record name, used as the file stem
     * @param config_root Base directory; empty = $XDG_CONFIG_HOME or ~/.config
     */
    explicit SettingsStore(std::string app_id,
                           std::string key = "config",
                           std::filesystem::path config_root = {});

    /**
     * Read the persisted record. Any read or parse failure returns defaults.
     */
    Settings load(bool sanitize) const;

    /**
     * Write the full record. Failures are logged and dropped.
     */
    void store(const Settings& settings) const;

    /**
     * Startup protocol: load once raw and once sanitized, apply the
     * command-line visibility override, and heal the stored record if
     * anything changed.
     */
    Settings loadForStartup(std::optional<bool> hidden_override = std::nullopt) const;

    const std::filesystem::path& path() const { return path_; }
    const std::string& appId() const { return app_id_; }

private:
    std::string app_id_;
    std::filesystem::path path_;
};

} // namespace ttsr::config
