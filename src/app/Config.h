#pragma once

#include "core/Types.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace clustermap {

class Config {
public:
    static Config& instance();

    // Read the per-user config file. A missing or unreadable file leaves
    // the defaults in place.
    void load();
    void save();

    void load(const std::string& path);
    void save(const std::string& path) const;

    void resetToDefaults();

    // Push palette overrides into ColorSystem
    void applyPalette() const;

    // Data sources (empty = built-in sample data)
    std::string hierarchyPath;
    std::string topicsPath;

    // Window settings
    int windowWidth = 1280;
    int windowHeight = 800;

    // Navigation
    bool syncModeDefault = true;

    // Appearance
    std::string themeName = "light";
    std::string fontPath;

    // Category colour overrides, l2 id -> "#RRGGBB"
    std::map<std::string, std::string> palette;

    // Get config file path
    static std::string getConfigPath();

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    Config() = default;
};

} // namespace clustermap
