#include "app/Config.h"
#include "color/ColorSystem.h"
#include "core/PlatformUtils.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#else
#include <sys/types.h>
#endif

namespace clustermap {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

// ============================================================================
// getConfigPath - platform-appropriate config file location
// ============================================================================
std::string Config::getConfigPath() {
#ifdef _WIN32
    // %APPDATA%/clustermap/config.json
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\clustermap\\config.json";
    }
    return "clustermap_config.json";
#elif defined(__APPLE__)
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support/clustermap/config.json";
    }
    return "clustermap_config.json";
#else
    // ~/.config/clustermap/config.json unless XDG_CONFIG_HOME says otherwise
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::string(xdgConfig) + "/clustermap/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/clustermap/config.json";
    }
    return "clustermap_config.json";
#endif
}

// Create each missing directory on the way to filePath
static void createParentDirs(const std::string& filePath) {
    auto lastSlash = filePath.find_last_of("/\\");
    if (lastSlash == std::string::npos) {
        return;
    }
    std::string dir = filePath.substr(0, lastSlash);

    std::string accumulated;
    for (size_t i = 0; i < dir.size(); ++i) {
        char c = dir[i];
        accumulated += c;
#ifdef _WIN32
        if (c == ':') {
            continue;
        }
#endif
        if (c == '/' || c == '\\' || i == dir.size() - 1) {
#ifdef _WIN32
            _mkdir(accumulated.c_str());
#else
            mkdir(accumulated.c_str(), 0755);
#endif
        }
    }
}

void Config::resetToDefaults() {
    hierarchyPath.clear();
    topicsPath.clear();
    windowWidth = 1280;
    windowHeight = 800;
    syncModeDefault = true;
    themeName = "light";
    fontPath.clear();
    palette.clear();
}

// ============================================================================
// load / save
// ============================================================================
void Config::load() {
    load(getConfigPath());
}

void Config::save() {
    save(getConfigPath());
}

void Config::load(const std::string& path) {
    resetToDefaults();

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        // First run: keep defaults
        return;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "clustermap: failed to parse config " << path << ": " << e.what() << std::endl;
        resetToDefaults();
    }
}

void Config::save(const std::string& path) const {
    createParentDirs(path);

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "clustermap: failed to write config to " << path << std::endl;
        return;
    }
    ofs << toJson().dump(4) << std::endl;
}

void Config::applyPalette() const {
    ColorSystem& colors = ColorSystem::instance();
    colors.init();
    for (const auto& entry : palette) {
        colors.setPaletteEntry(entry.first, PlatformUtils::hex2rgb(entry.second));
    }
}

// ============================================================================
// toJson / fromJson
// ============================================================================
nlohmann::json Config::toJson() const {
    nlohmann::json j;

    j["hierarchyPath"] = hierarchyPath;
    j["topicsPath"] = topicsPath;
    j["syncModeDefault"] = syncModeDefault;
    j["themeName"] = themeName;
    j["fontPath"] = fontPath;

    j["window"]["width"] = windowWidth;
    j["window"]["height"] = windowHeight;

    j["palette"] = nlohmann::json::object();
    for (const auto& entry : palette) {
        j["palette"][entry.first] = entry.second;
    }

    return j;
}

void Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        std::cerr << "clustermap: config root is not an object, using defaults" << std::endl;
        return;
    }

    if (j.contains("hierarchyPath") && j["hierarchyPath"].is_string()) {
        hierarchyPath = j["hierarchyPath"].get<std::string>();
    }
    if (j.contains("topicsPath") && j["topicsPath"].is_string()) {
        topicsPath = j["topicsPath"].get<std::string>();
    }
    if (j.contains("syncModeDefault") && j["syncModeDefault"].is_boolean()) {
        syncModeDefault = j["syncModeDefault"].get<bool>();
    }
    if (j.contains("themeName") && j["themeName"].is_string()) {
        themeName = j["themeName"].get<std::string>();
    }
    if (j.contains("fontPath") && j["fontPath"].is_string()) {
        fontPath = j["fontPath"].get<std::string>();
    }

    if (j.contains("window") && j["window"].is_object()) {
        const auto& jw = j["window"];
        if (jw.contains("width") && jw["width"].is_number_integer()) {
            windowWidth = jw["width"].get<int>();
        }
        if (jw.contains("height") && jw["height"].is_number_integer()) {
            windowHeight = jw["height"].get<int>();
        }
    }

    if (j.contains("palette") && j["palette"].is_object()) {
        for (auto it = j["palette"].begin(); it != j["palette"].end(); ++it) {
            if (!it.value().is_string()) {
                continue;
            }
            std::string hex = it.value().get<std::string>();
            if (PlatformUtils::isHexColor(hex)) {
                palette[it.key()] = hex;
            } else {
                std::cerr << "clustermap: ignoring palette entry " << it.key()
                          << ": '" << hex << "' is not a #RRGGBB colour" << std::endl;
            }
        }
    }
}

} // namespace clustermap
