#pragma once

#include "core/types.h"
#include <map>
#include <optional>
#include <string>

namespace station {

// Cosmetic session names, kept in terminal_names.json as
// { "<project id>": { "<slot>": "<name>" } }. A slot is the session's 0-based
// position in its project's list, so names outlive the processes they label.
// Every change is written through immediately.
class DisplayNameStore {
public:
    DisplayNameStore();
    explicit DisplayNameStore(const std::string& store_path);

    bool load();
    bool save() const;

    std::optional<std::string> get(const ProjectId& project_id, size_t slot) const;
    bool set(const ProjectId& project_id, size_t slot, const std::string& name);
    bool clear(const ProjectId& project_id, size_t slot);

    // Drops the name at slot and moves every later name one slot down.
    bool remove_slot(const ProjectId& project_id, size_t slot);

    const std::string& path() const { return store_path_; }

private:
    std::string store_path_;
    std::map<ProjectId, std::map<size_t, std::string>> names_;
};

}
