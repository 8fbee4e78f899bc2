/**
 * Settings.cpp - JSON-backed settings store
 */

#include "ttsr/config/Settings.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path defaultConfigRoot() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

// All four fields are required. Anything else is treated as a corrupt record.
ttsr::config::Settings fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("settings root is not an object");
    }

    const auto& voice = j.at("voice_name");
    const auto& rate = j.at("rate");
    const auto& volume = j.at("volume");
    const auto& hidden = j.at("hidden");

    if (!voice.is_string()) throw std::runtime_error("voice_name is not a string");
    if (!rate.is_number_integer()) throw std::runtime_error("rate is not an integer");
    if (!volume.is_number_unsigned()) throw std::runtime_error("volume is not an unsigned integer");
    if (!hidden.is_boolean()) throw std::runtime_error("hidden is not a boolean");

    // Reject values that do not fit the field instead of truncating them
    if (rate.is_number_unsigned()) {
        if (rate.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error("rate out of range");
        }
    } else {
        auto r = rate.get<std::int64_t>();
        if (r < std::numeric_limits<int>::min() || r > std::numeric_limits<int>::max()) {
            throw std::runtime_error("rate out of range");
        }
    }
    if (volume.get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
        throw std::runtime_error("volume out of range");
    }

    ttsr::config::Settings s;
    s.voice_name = voice.get<std::string>();
    s.rate = static_cast<int>(rate.get<std::int64_t>());
    s.volume = static_cast<unsigned>(volume.get<std::uint64_t>());
    s.hidden = hidden.get<bool>();
    return s;
}

json toJson(const ttsr::config::Settings& s) {
    return json{
        {"voice_name", s.voice_name},
        {"rate", s.rate},
        {"volume", s.volume},
        {"hidden", s.hidden}
    };
}

} // anonymous namespace

namespace ttsr::config {

int clampRate(int rate) {
    return std::clamp(rate, kMinRate, kMaxRate);
}

unsigned clampVolume(unsigned volume) {
    return std::min(volume, kMaxVolume);
}

Settings sanitize(Settings settings) {
    settings.rate = clampRate(settings.rate);
    settings.volume = clampVolume(settings.volume);
    return settings;
}

SettingsStore::SettingsStore(std::string app_id, std::string key, fs::path config_root)
    : app_id_(std::move(app_id)) {
    if (config_root.empty()) {
        config_root = defaultConfigRoot();
    }
    path_ = config_root / app_id_ / (key + ".json");
}

Settings SettingsStore::load(bool sanitize_values) const {
    std::ifstream in(path_);
    if (!in.good()) {
        return Settings{};
    }

    try {
        json j = json::parse(in);
        Settings s = fromJson(j);
        return sanitize_values ? sanitize(s) : s;
    } catch (const std::exception& e) {
        std::cerr << "[Settings] Ignoring unreadable " << path_ << ": " << e.what() << std::endl;
        return Settings{};
    }
}

void SettingsStore::store(const Settings& settings) const {
    try {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            std::cerr << "[Settings] Cannot create " << path_.parent_path()
                      << ": " << ec.message() << std::endl;
            return;
        }

        std::ofstream out(path_, std::ios::trunc);
        if (!out.good()) {
            std::cerr << "[Settings] Cannot open " << path_ << " for writing" << std::endl;
            return;
        }
        out << toJson(settings).dump(4) << '\n';
        if (!out.good()) {
            std::cerr << "[Settings] Write to " << path_ << " failed" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Settings] Store failed: " << e.what() << std::endl;
    }
}

Settings SettingsStore::loadForStartup(std::optional<bool> hidden_override) const {
    const Settings original = load(false);
    Settings settings = load(true);

    if (hidden_override) {
        settings.hidden = *hidden_override;
    }

    std::error_code ec;
    if (settings != original || !fs::exists(path_, ec)) {
        std::cout << "[Settings] Writing settings to " << path_ << std::endl;
        store(settings);
    }
    return settings;
}

} // namespace ttsr::config
