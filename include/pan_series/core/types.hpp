#pragma once

#include <Eigen/Dense>
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pan_series {

namespace fs = std::filesystem;

// Band grids (row-major, row 0 is the northern edge)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du16 = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Acquisition instant, always UTC
using Timestamp = std::chrono::system_clock::time_point;

// Axis-aligned geographic box in degrees
struct BBox {
    double min_lon = 0.0;
    double min_lat = 0.0;
    double max_lon = 0.0;
    double max_lat = 0.0;
};

// Inclusive on both ends
struct TimeRange {
    Timestamp start;
    Timestamp end;

    bool contains(const Timestamp& ts) const { return ts >= start && ts <= end; }
};

enum class Resampling {
    NEAREST,
    BILINEAR,
    BICUBIC
};

inline std::string resampling_to_string(Resampling method) {
    switch (method) {
        case Resampling::NEAREST: return "NEAREST";
        case Resampling::BILINEAR: return "BILINEAR";
        case Resampling::BICUBIC: return "BICUBIC";
        default: return "UNKNOWN";
    }
}

Resampling string_to_resampling(const std::string& s);

enum class DataType {
    UINT8,
    UINT16,
    FLOAT32
};

inline std::string data_type_to_string(DataType type) {
    switch (type) {
        case DataType::UINT8: return "UINT8";
        case DataType::UINT16: return "UINT16";
        case DataType::FLOAT32: return "FLOAT32";
        default: return "UNKNOWN";
    }
}

// GDAL convention: x = t[0] + col*t[1] + row*t[2], y = t[3] + col*t[4] + row*t[5]
using GeoTransform = std::array<double, 6>;

// Pixel grid shared by every band of a stack
struct Grid {
    std::string crs = "EPSG:4326";
    GeoTransform transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    int rows = 0;
    int cols = 0;

    bool same_shape(int r, int c) const { return rows == r && cols == c; }
};

bool operator==(const Grid& a, const Grid& b);
inline bool operator!=(const Grid& a, const Grid& b) { return !(a == b); }

// Pipeline phase enumeration
enum class Phase {
    RESOLVE_CATALOG = 0,
    RESOLVE_COLLECTION = 1,
    LOAD = 2,
    PANSHARPEN = 3,
    EXPORT_ANALYSIS = 4,
    RESCALE = 5,
    EXPORT_DISPLAY = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::RESOLVE_CATALOG: return "RESOLVE_CATALOG";
        case Phase::RESOLVE_COLLECTION: return "RESOLVE_COLLECTION";
        case Phase::LOAD: return "LOAD";
        case Phase::PANSHARPEN: return "PANSHARPEN";
        case Phase::EXPORT_ANALYSIS: return "EXPORT_ANALYSIS";
        case Phase::RESCALE: return "RESCALE";
        case Phase::EXPORT_DISPLAY: return "EXPORT_DISPLAY";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

// Date helpers (UTC)
std::string format_date(const Timestamp& ts);
std::string format_iso8601(const Timestamp& ts);
Timestamp parse_timestamp(const std::string& s);
Timestamp make_date(int year, int month, int day);

std::string describe_bbox(const BBox& bbox);

} // namespace pan_series
