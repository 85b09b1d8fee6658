#include "geometry_sync.h"
#include "process/session_registry.h"
#include <algorithm>
#include <climits>
#include <cmath>

namespace station {

GeometrySynchronizer::GeometrySynchronizer(SessionRegistry& registry, CellMetrics metrics, float zoom)
    : registry_(registry)
    , metrics_(metrics)
    , zoom_(clamp_zoom(zoom))
{
    grid_.cols = registry.config().default_cols;
    grid_.rows = registry.config().default_rows;
}

GridSize GeometrySynchronizer::fit(float width_px, float height_px, CellMetrics metrics, float zoom) {
    float cell_w = std::max(1e-3f, metrics.width * clamp_zoom(zoom));
    float cell_h = std::max(1e-3f, metrics.height * clamp_zoom(zoom));

    double cols = std::floor(std::max(0.0f, width_px) / cell_w);
    double rows = std::floor(std::max(0.0f, height_px) / cell_h);

    GridSize grid;
    grid.cols = static_cast<int>(std::clamp(cols, 1.0, static_cast<double>(USHRT_MAX)));
    grid.rows = static_cast<int>(std::clamp(rows, 1.0, static_cast<double>(USHRT_MAX)));
    return grid;
}

void GeometrySynchronizer::recompute() {
    if (has_surface_) {
        grid_ = fit(width_px_, height_px_, metrics_, zoom_);
    }
}

GridSize GeometrySynchronizer::surface_changed(const SessionId& id, float width_px, float height_px) {
    has_surface_ = true;
    width_px_ = width_px;
    height_px_ = height_px;
    recompute();
    if (!id.empty()) {
        sync(id);
    }
    return grid_;
}

GridSize GeometrySynchronizer::zoom_changed(const SessionId& id, float zoom) {
    zoom_ = clamp_zoom(zoom);
    recompute();
    if (!id.empty()) {
        sync(id);
    }
    return grid_;
}

GridSize GeometrySynchronizer::became_visible(const SessionId& id) {
    // Whatever was sent while hidden may be stale; send again.
    applied_.erase(id);
    sync(id);
    return grid_;
}

Status GeometrySynchronizer::sync(const SessionId& id) {
    auto it = applied_.find(id);
    if (it != applied_.end() && it->second == grid_) {
        return {};
    }

    Status status = registry_.resize(id, grid_.cols, grid_.rows);
    if (status.code == ErrorCode::Ok) {
        applied_[id] = grid_;
    } else {
        applied_.erase(id);
    }
    return status;
}

void GeometrySynchronizer::forget(const SessionId& id) {
    applied_.erase(id);
}

}
