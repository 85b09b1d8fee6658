#pragma once

#include <string>
#include <utility>
#include <vector>

namespace station {

constexpr int DEFAULT_COLS = 80;
constexpr int DEFAULT_ROWS = 24;
constexpr float MIN_ZOOM = 0.5f;
constexpr float MAX_ZOOM = 2.0f;
constexpr float ZOOM_STEP = 0.1f;

float clamp_zoom(float zoom);

struct StationConfig {
    // Empty means $SHELL, then /bin/bash.
    std::string shell;
    std::vector<std::string> shell_args{"-l"};
    std::vector<std::pair<std::string, std::string>> env;

    int default_cols = DEFAULT_COLS;
    int default_rows = DEFAULT_ROWS;

    // Pixel size of one character cell at zoom 1.0.
    float cell_width = 8.0f;
    float cell_height = 16.0f;
    float zoom = 1.0f;

    std::string resolved_shell() const;
};

// $XDG_CONFIG_HOME/agent-station, else ~/.config/agent-station.
std::string default_config_dir();

class ConfigStore {
public:
    ConfigStore();
    explicit ConfigStore(const std::string& config_path);

    StationConfig load() const;
    bool save(const StationConfig& config) const;

    const std::string& path() const { return config_path_; }

private:
    std::string config_path_;
};

}
