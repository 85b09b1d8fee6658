#pragma once

#include "adapters/station_config.h"
#include "core/types.h"
#include <unordered_map>

namespace station {

class SessionRegistry;

struct GridSize {
    int cols = DEFAULT_COLS;
    int rows = DEFAULT_ROWS;

    bool operator==(const GridSize& other) const { return cols == other.cols && rows == other.rows; }
    bool operator!=(const GridSize& other) const { return !(*this == other); }
};

struct CellMetrics {
    float width = 8.0f;
    float height = 16.0f;
};

// Turns pane surface size and zoom into a column/row grid and pushes it to the
// pseudo-terminal of whichever session is shown. Surface changes, first
// display and zoom changes all end up in sync(). UI thread only.
class GeometrySynchronizer {
public:
    GeometrySynchronizer(SessionRegistry& registry, CellMetrics metrics, float zoom = 1.0f);

    static GridSize fit(float width_px, float height_px, CellMetrics metrics, float zoom);

    GridSize surface_changed(const SessionId& id, float width_px, float height_px);
    GridSize zoom_changed(const SessionId& id, float zoom);
    GridSize became_visible(const SessionId& id);

    // Sends the current grid unless this session already has it. A dead
    // session is dropped without complaint.
    Status sync(const SessionId& id);
    void forget(const SessionId& id);

    GridSize grid() const { return grid_; }
    float zoom() const { return zoom_; }
    CellMetrics metrics() const { return metrics_; }

private:
    void recompute();

    SessionRegistry& registry_;
    CellMetrics metrics_;
    float zoom_;

    bool has_surface_ = false;
    float width_px_ = 0.0f;
    float height_px_ = 0.0f;

    GridSize grid_;
    std::unordered_map<SessionId, GridSize> applied_;
};

}
