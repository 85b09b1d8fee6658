#pragma once

#include "core/types.h"
#include <optional>
#include <string>
#include <vector>

namespace station {

// The folders the user has added, kept in projects.json. Sessions refer to a
// project only through its id.
class ProjectStore {
public:
    ProjectStore();
    explicit ProjectStore(const std::string& store_path);

    bool load();
    bool save() const;

    // Returns the existing project when the folder is already known.
    std::optional<Project> add(const std::string& path);
    bool remove(const ProjectId& id);

    std::optional<Project> find(const ProjectId& id) const;
    std::optional<Project> find_by_path(const std::string& path) const;

    const std::vector<Project>& projects() const { return projects_; }
    const std::string& path() const { return store_path_; }

    static ProjectId make_id(const std::string& canonical_path);

private:
    std::string store_path_;
    std::vector<Project> projects_;
};

}
