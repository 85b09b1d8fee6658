#include "adapters/display_name_store.h"
#include "adapters/station_config.h"
#include "core/log.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace station {

namespace {

std::string default_store_path() {
    std::string dir = default_config_dir();
    if (dir.empty()) return "";
    return dir + "/terminal_names.json";
}

bool parse_slot(const std::string& key, size_t& slot) {
    if (key.empty() || key.size() > 9) return false;
    size_t value = 0;
    for (char c : key) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    slot = value;
    return true;
}

}

DisplayNameStore::DisplayNameStore()
    : store_path_(default_store_path())
{
}

DisplayNameStore::DisplayNameStore(const std::string& store_path)
    : store_path_(store_path)
{
}

bool DisplayNameStore::load() {
    if (store_path_.empty()) return false;

    std::ifstream file(store_path_);
    if (!file.is_open()) {
        return true;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            log_message("store", "%s: expected a JSON object", store_path_.c_str());
            return false;
        }

        names_.clear();
        for (const auto& [project_id, slots] : j.items()) {
            if (!slots.is_object()) continue;
            for (const auto& [key, name] : slots.items()) {
                size_t slot = 0;
                if (!parse_slot(key, slot) || !name.is_string()) continue;
                std::string value = name.get<std::string>();
                if (!value.empty()) {
                    names_[project_id][slot] = value;
                }
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        log_message("store", "%s: %s", store_path_.c_str(), e.what());
        return false;
    }
}

bool DisplayNameStore::save() const {
    if (store_path_.empty()) return false;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(fs::path(store_path_).parent_path(), ec);
    if (ec) {
        log_message("store", "cannot create %s: %s", store_path_.c_str(), ec.message().c_str());
        return false;
    }

    nlohmann::json j = nlohmann::json::object();
    for (const auto& [project_id, slots] : names_) {
        if (slots.empty()) continue;
        nlohmann::json p = nlohmann::json::object();
        for (const auto& [slot, name] : slots) {
            p[std::to_string(slot)] = name;
        }
        j[project_id] = p;
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

std::optional<std::string> DisplayNameStore::get(const ProjectId& project_id, size_t slot) const {
    auto project_it = names_.find(project_id);
    if (project_it == names_.end()) return std::nullopt;
    auto slot_it = project_it->second.find(slot);
    if (slot_it == project_it->second.end()) return std::nullopt;
    return slot_it->second;
}

bool DisplayNameStore::set(const ProjectId& project_id, size_t slot, const std::string& name) {
    if (name.empty()) {
        return clear(project_id, slot);
    }
    names_[project_id][slot] = name;
    return save();
}

bool DisplayNameStore::clear(const ProjectId& project_id, size_t slot) {
    auto project_it = names_.find(project_id);
    if (project_it == names_.end() || project_it->second.erase(slot) == 0) {
        return false;
    }
    if (project_it->second.empty()) {
        names_.erase(project_it);
    }
    return save();
}

bool DisplayNameStore::remove_slot(const ProjectId& project_id, size_t slot) {
    auto project_it = names_.find(project_id);
    if (project_it == names_.end()) return false;

    auto& slots = project_it->second;
    if (slots.empty() || slots.rbegin()->first < slot) {
        return false;
    }

    std::map<size_t, std::string> shifted;
    for (auto& [index, name] : slots) {
        if (index < slot) {
            shifted[index] = std::move(name);
        } else if (index > slot) {
            shifted[index - 1] = std::move(name);
        }
    }

    if (shifted.empty()) {
        names_.erase(project_it);
    } else {
        slots = std::move(shifted);
    }
    return save();
}

}
