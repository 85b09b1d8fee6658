#include "adapters/project_store.h"
#include "adapters/station_config.h"
#include "core/log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace station {

namespace {

std::string default_store_path() {
    std::string dir = default_config_dir();
    if (dir.empty()) return "";
    return dir + "/projects.json";
}

std::string folder_name(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    if (name.empty()) {
        name = path.string();
    }
    return name;
}

}

ProjectStore::ProjectStore()
    : store_path_(default_store_path())
{
}

ProjectStore::ProjectStore(const std::string& store_path)
    : store_path_(store_path)
{
}

ProjectId ProjectStore::make_id(const std::string& canonical_path) {
    // FNV-1a, so a folder keeps its id if it is removed and added again.
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : canonical_path) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string("p-") + buffer;
}

bool ProjectStore::load() {
    if (store_path_.empty()) return false;

    std::ifstream file(store_path_);
    if (!file.is_open()) {
        return true;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) {
            log_message("store", "%s: expected a JSON array", store_path_.c_str());
            return false;
        }

        projects_.clear();
        for (const auto& item : j) {
            if (!item.is_object()) continue;
            Project project;
            if (item.contains("path") && item["path"].is_string()) {
                project.path = item["path"].get<std::string>();
            }
            if (project.path.empty()) continue;

            if (item.contains("id") && item["id"].is_string()) {
                project.id = item["id"].get<std::string>();
            }
            if (project.id.empty()) {
                project.id = make_id(project.path);
            }
            if (item.contains("name") && item["name"].is_string()) {
                project.name = item["name"].get<std::string>();
            }
            if (project.name.empty()) {
                project.name = folder_name(project.path);
            }
            projects_.push_back(project);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        log_message("store", "%s: %s", store_path_.c_str(), e.what());
        return false;
    }
}

bool ProjectStore::save() const {
    if (store_path_.empty()) return false;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(fs::path(store_path_).parent_path(), ec);
    if (ec) {
        log_message("store", "cannot create %s: %s", store_path_.c_str(), ec.message().c_str());
        return false;
    }

    nlohmann::json j = nlohmann::json::array();
    for (const auto& project : projects_) {
        nlohmann::json p;
        p["id"] = project.id;
        p["path"] = project.path;
        p["name"] = project.name;
        j.push_back(p);
    }

    std::string temp_path = store_path_ + ".tmp";
    std::ofstream file(temp_path);
    if (!file.is_open()) return false;

    file << j.dump(2);
    file.close();

    if (!file.good()) {
        std::remove(temp_path.c_str());
        return false;
    }

    if (std::rename(temp_path.c_str(), store_path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return false;
    }

    return true;
}

std::optional<Project> ProjectStore::add(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path canonical = fs::canonical(fs::path(path), ec);
    if (ec || !fs::is_directory(canonical, ec)) {
        log_message("store", "not a directory: %s", path.c_str());
        return std::nullopt;
    }

    std::string canonical_path = canonical.string();
    if (auto existing = find_by_path(canonical_path)) {
        return existing;
    }

    Project project;
    project.id = make_id(canonical_path);
    project.path = canonical_path;
    project.name = folder_name(canonical);
    projects_.push_back(project);

    if (!save() && !store_path_.empty()) {
        log_message("store", "cannot write %s", store_path_.c_str());
    }
    return project;
}

bool ProjectStore::remove(const ProjectId& id) {
    auto it = std::find_if(projects_.begin(), projects_.end(),
        [&id](const Project& p) { return p.id == id; });
    if (it == projects_.end()) return false;

    projects_.erase(it);
    return save();
}

std::optional<Project> ProjectStore::find(const ProjectId& id) const {
    for (const auto& p : projects_) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

std::optional<Project> ProjectStore::find_by_path(const std::string& path) const {
    for (const auto& p : projects_) {
        if (p.path == path) return p;
    }
    return std::nullopt;
}

}
