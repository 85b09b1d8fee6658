#include "adapters/station_config.h"
#include "core/log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace station {

namespace {

std::string default_config_path() {
    std::string dir = default_config_dir();
    if (dir.empty()) return "";
    return dir + "/config.json";
}

int positive_or(const nlohmann::json& j, const char* key, int fallback) {
    if (j.contains(key) && j[key].is_number_integer()) {
        int value = j[key].get<int>();
        if (value > 0) return value;
    }
    return fallback;
}

float positive_or(const nlohmann::json& j, const char* key, float fallback) {
    if (j.contains(key) && j[key].is_number()) {
        float value = j[key].get<float>();
        if (value > 0.0f) return value;
    }
    return fallback;
}

}

float clamp_zoom(float zoom) {
    return std::clamp(zoom, MIN_ZOOM, MAX_ZOOM);
}

std::string StationConfig::resolved_shell() const {
    if (!shell.empty()) return shell;
    const char* env_shell = std::getenv("SHELL");
    if (env_shell && *env_shell) return env_shell;
    return "/bin/bash";
}

std::string default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/agent-station";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/agent-station";
}

ConfigStore::ConfigStore()
    : config_path_(default_config_path())
{
}

ConfigStore::ConfigStore(const std::string& config_path)
    : config_path_(config_path)
{
}

StationConfig ConfigStore::load() const {
    StationConfig config;

    if (config_path_.empty()) return config;

    std::ifstream file(config_path_);
    if (!file) return config;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            log_message("config", "%s: expected a JSON object, using defaults", config_path_.c_str());
            return config;
        }

        if (j.contains("shell") && j["shell"].is_string()) {
            config.shell = j["shell"].get<std::string>();
        }
        if (j.contains("shell_args") && j["shell_args"].is_array()) {
            config.shell_args.clear();
            for (const auto& arg : j["shell_args"]) {
                if (arg.is_string()) {
                    config.shell_args.push_back(arg.get<std::string>());
                }
            }
        }
        if (j.contains("env") && j["env"].is_object()) {
            for (const auto& [key, value] : j["env"].items()) {
                if (value.is_string()) {
                    config.env.emplace_back(key, value.get<std::string>());
                }
            }
        }

        config.default_cols = positive_or(j, "default_cols", config.default_cols);
        config.default_rows = positive_or(j, "default_rows", config.default_rows);
        config.cell_width = positive_or(j, "cell_width", config.cell_width);
        config.cell_height = positive_or(j, "cell_height", config.cell_height);
        config.zoom = clamp_zoom(positive_or(j, "zoom", config.zoom));
    } catch (const nlohmann::json::exception& e) {
        log_message("config", "%s: %s, using defaults", config_path_.c_str(), e.what());
        return StationConfig{};
    }

    return config;
}

bool ConfigStore::save(const StationConfig& config) const {
    if (config_path_.empty()) return false;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(fs::path(config_path_).parent_path(), ec);
    if (ec) {
        log_message("config", "cannot create %s: %s", config_path_.c_str(), ec.message().c_str());
        return false;
    }

    nlohmann::json j;
    j["shell"] = config.shell;
    j["shell_args"] = config.shell_args;
    nlohmann::json env = nlohmann::json::object();
    for (const auto& kv : config.env) {
        env[kv.first] = kv.second;
    }
    j["env"] = env;
    j["default_cols"] = config.default_cols;
    j["default_rows"] = config.default_rows;
    j["cell_width"] = config.cell_width;
    j["cell_height"] = config.cell_height;
    j["zoom"] = clamp_zoom(config.zoom);

    std::ofstream file(config_path_);
    if (!file) return false;
    file << j.dump(2);
    return file.good();
}

}
