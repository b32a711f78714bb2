#pragma once

#include "pan_series/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pan_series::model {

// One timestamp's frame. All bands share the same shape.
struct Scene {
    Timestamp timestamp;
    std::map<std::string, Matrix2Df> bands;
    std::optional<double> cloud_coverage;

    bool has_band(const std::string& name) const { return bands.count(name) > 0; }
    // Throws ValidationError when the band is absent
    const Matrix2Df& band(const std::string& name) const;
};

// Time-ordered scenes on one pixel grid. Derived products are new stacks.
class RasterStack {
public:
    RasterStack(std::vector<Scene> scenes, Grid grid, std::vector<std::string> band_names,
                std::map<std::string, float> nodata);

    const std::vector<Scene>& scenes() const { return scenes_; }
    const Grid& grid() const { return grid_; }
    const std::vector<std::string>& band_names() const { return band_names_; }
    const std::map<std::string, float>& nodata() const { return nodata_; }

    float nodata_for(const std::string& band) const;
    bool has_band(const std::string& band) const;
    size_t size() const { return scenes_.size(); }
    bool empty() const { return scenes_.empty(); }

private:
    std::vector<Scene> scenes_;
    Grid grid_;
    std::vector<std::string> band_names_;
    std::map<std::string, float> nodata_;
};

// Rescaled display frame
struct IntScene {
    Timestamp timestamp;
    std::map<std::string, Matrix2Du16> bands;

    const Matrix2Du16& band(const std::string& name) const;
};

class IntStack {
public:
    IntStack(std::vector<IntScene> scenes, Grid grid, std::vector<std::string> band_names,
             DataType element_type, int out_max);

    const std::vector<IntScene>& scenes() const { return scenes_; }
    const Grid& grid() const { return grid_; }
    const std::vector<std::string>& band_names() const { return band_names_; }
    // UINT8 when out_max fits in a byte, otherwise UINT16
    DataType element_type() const { return element_type_; }
    int out_max() const { return out_max_; }
    size_t size() const { return scenes_.size(); }

private:
    std::vector<IntScene> scenes_;
    Grid grid_;
    std::vector<std::string> band_names_;
    DataType element_type_;
    int out_max_;
};

} // namespace pan_series::model
