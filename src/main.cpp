#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

#include "adapters/display_name_store.h"
#include "adapters/project_store.h"
#include "adapters/station_config.h"
#include "app/console_frontend.h"
#include "process/session_registry.h"

namespace fs = std::filesystem;

static void print_usage(const char* argv0) {
    fprintf(stderr,
        "usage: %s [--config PATH] [DIR...]\n"
        "\n"
        "Opens a shell for each project folder. Keys after Ctrl-]:\n"
        "  c  new terminal       x  close terminal\n"
        "  n  next terminal      p  previous terminal\n"
        "  ]  next project       [  previous project\n"
        "  +  zoom in            -  zoom out\n"
        "  0  reset zoom         r  rename terminal\n"
        "  q  quit\n",
        argv0);
}

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> dirs;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            dirs.push_back(argv[i]);
        }
    }

    station::ConfigStore config_store = config_path.empty()
        ? station::ConfigStore()
        : station::ConfigStore(config_path);
    station::StationConfig config = config_store.load();

    station::ProjectStore project_store;
    if (!project_store.load()) {
        fprintf(stderr, "station: ignoring unreadable %s\n", project_store.path().c_str());
    }

    std::vector<station::Project> projects;
    if (dirs.empty()) {
        projects = project_store.projects();
        if (projects.empty()) {
            std::error_code ec;
            fs::path cwd = fs::current_path(ec);
            if (!ec) {
                dirs.push_back(cwd.string());
            }
        }
    }
    for (const auto& dir : dirs) {
        auto project = project_store.add(dir);
        if (!project) {
            fprintf(stderr, "station: %s is not a directory\n", dir.c_str());
            return 1;
        }
        bool listed = false;
        for (const auto& p : projects) {
            listed = listed || p.id == project->id;
        }
        if (!listed) {
            projects.push_back(*project);
        }
    }

    station::DisplayNameStore names;
    if (!names.load()) {
        fprintf(stderr, "station: ignoring unreadable %s\n", names.path().c_str());
    }

    station::SessionRegistry registry(config);
    station::ConsoleFrontend frontend(registry, names, STDIN_FILENO, STDOUT_FILENO);
    return frontend.run(projects);
}
