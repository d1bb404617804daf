#pragma once

#include "annual_mosaic/core/types.hpp"
#include <string>
#include <vector>

namespace annual_mosaic::pipeline {

struct SceneRef {
    std::string scene_id;
    Date acquired;
};

// Supplies the scenes of one run. Implementations decide where rasters come
// from; the runner only sees grids and scenes.
class SceneSource {
public:
    virtual ~SceneSource() = default;

    // Grid every composite of the run is built on.
    virtual GridInfo target_grid() const = 0;

    // Scenes acquired inside `window`, ordered by scene id.
    virtual std::vector<SceneRef> scenes_in_window(const DateWindow& window) const = 0;

    // Throws on unreadable input; the runner rejects the scene.
    virtual Scene load(const SceneRef& ref) const = 0;
};

} // namespace annual_mosaic::pipeline
