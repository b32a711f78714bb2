#include "pan_series/model/raster_stack.hpp"
#include "pan_series/core/errors.hpp"

#include <set>

namespace pan_series::model {

namespace {

void check_band_names(const std::vector<std::string>& band_names) {
    std::set<std::string> seen;
    for (const auto& name : band_names) {
        if (!seen.insert(name).second) {
            throw ValidationError("duplicate band '" + name + "' in stack");
        }
    }
}

template <typename SceneT>
void check_scenes(const std::vector<SceneT>& scenes, const Grid& grid,
                  const std::vector<std::string>& band_names) {
    for (size_t i = 0; i < scenes.size(); ++i) {
        const auto& scene = scenes[i];
        if (i > 0 && !(scenes[i - 1].timestamp < scene.timestamp)) {
            throw ValidationError("scene timestamps must be strictly increasing at " +
                                  format_iso8601(scene.timestamp));
        }
        if (scene.bands.size() != band_names.size()) {
            throw ValidationError("scene " + format_date(scene.timestamp) + " has " +
                                  std::to_string(scene.bands.size()) + " bands, expected " +
                                  std::to_string(band_names.size()));
        }
        for (const auto& name : band_names) {
            auto it = scene.bands.find(name);
            if (it == scene.bands.end()) {
                throw ValidationError("scene " + format_date(scene.timestamp) +
                                      " is missing band '" + name + "'");
            }
            const auto& m = it->second;
            if (!grid.same_shape(static_cast<int>(m.rows()), static_cast<int>(m.cols()))) {
                throw ValidationError("band '" + name + "' of scene " + format_date(scene.timestamp) +
                                      " is " + std::to_string(m.rows()) + "x" + std::to_string(m.cols()) +
                                      ", grid is " + std::to_string(grid.rows) + "x" +
                                      std::to_string(grid.cols));
            }
        }
    }
}

} // namespace

const Matrix2Df& Scene::band(const std::string& name) const {
    auto it = bands.find(name);
    if (it == bands.end()) {
        throw ValidationError("scene " + format_date(timestamp) + " has no band '" + name + "'");
    }
    return it->second;
}

RasterStack::RasterStack(std::vector<Scene> scenes, Grid grid, std::vector<std::string> band_names,
                         std::map<std::string, float> nodata)
    : scenes_(std::move(scenes)), grid_(std::move(grid)), band_names_(std::move(band_names)),
      nodata_(std::move(nodata)) {
    if (grid_.rows < 1 || grid_.cols < 1) {
        throw ValidationError("stack grid must be at least 1x1");
    }
    check_band_names(band_names_);
    check_scenes(scenes_, grid_, band_names_);
}

float RasterStack::nodata_for(const std::string& band) const {
    auto it = nodata_.find(band);
    if (it == nodata_.end()) {
        return 0.0f;
    }
    return it->second;
}

bool RasterStack::has_band(const std::string& band) const {
    for (const auto& b : band_names_) {
        if (b == band) return true;
    }
    return false;
}

const Matrix2Du16& IntScene::band(const std::string& name) const {
    auto it = bands.find(name);
    if (it == bands.end()) {
        throw ValidationError("scene " + format_date(timestamp) + " has no band '" + name + "'");
    }
    return it->second;
}

IntStack::IntStack(std::vector<IntScene> scenes, Grid grid, std::vector<std::string> band_names,
                   DataType element_type, int out_max)
    : scenes_(std::move(scenes)), grid_(std::move(grid)), band_names_(std::move(band_names)),
      element_type_(element_type), out_max_(out_max) {
    if (element_type_ == DataType::FLOAT32) {
        throw ValidationError("integer stack cannot hold FLOAT32 values");
    }
    if (out_max_ < 1 || (element_type_ == DataType::UINT8 && out_max_ > 255) || out_max_ > 65535) {
        throw ValidationError("out_max " + std::to_string(out_max_) + " does not fit " +
                              data_type_to_string(element_type_));
    }
    check_band_names(band_names_);
    check_scenes(scenes_, grid_, band_names_);
}

} // namespace pan_series::model
