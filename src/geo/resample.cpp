#include "pan_series/geo/resample.hpp"
#include "pan_series/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace pan_series::geo {

namespace {

// Mask weights below this count as touched by an invalid source pixel
constexpr float kFullMask = 0.999f;

int to_cv_interpolation(Resampling method) {
    switch (method) {
        case Resampling::NEAREST: return cv::INTER_NEAREST;
        case Resampling::BILINEAR: return cv::INTER_LINEAR;
        case Resampling::BICUBIC: return cv::INTER_CUBIC;
        default: return cv::INTER_NEAREST;
    }
}

Matrix2Df resize_plane(const Matrix2Df& src, int rows, int cols, int interpolation) {
    cv::Mat cv_src(static_cast<int>(src.rows()), static_cast<int>(src.cols()), CV_32F,
                   const_cast<float*>(src.data()));
    cv::Mat cv_dst;
    cv::resize(cv_src, cv_dst, cv::Size(cols, rows), 0.0, 0.0, interpolation);

    Matrix2Df out(rows, cols);
    if (cv_dst.isContinuous()) {
        std::memcpy(out.data(), cv_dst.data, static_cast<size_t>(out.size()) * sizeof(float));
    } else {
        for (int r = 0; r < cv_dst.rows; ++r) {
            std::memcpy(out.data() + static_cast<size_t>(r) * static_cast<size_t>(cols),
                        cv_dst.ptr<float>(r), static_cast<size_t>(cols) * sizeof(float));
        }
    }
    return out;
}

} // namespace

Matrix2Df resample(const Matrix2Df& src, int rows, int cols, Resampling method,
                   std::optional<float> nodata) {
    if (rows < 1 || cols < 1) {
        throw ValidationError("resample target must be at least 1x1");
    }
    if (src.size() == 0) {
        throw ValidationError("cannot resample an empty band");
    }
    if (src.rows() == rows && src.cols() == cols) {
        return src;
    }

    const int interpolation = to_cv_interpolation(method);
    if (method == Resampling::NEAREST) {
        return resize_plane(src, rows, cols, interpolation);
    }

    // Invalid pixels are zeroed so they cannot leak into the interpolated values
    Matrix2Df values = src;
    Matrix2Df mask = Matrix2Df::Ones(src.rows(), src.cols());
    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    bool any_invalid = false;
    for (Eigen::Index i = 0; i < src.size(); ++i) {
        const float v = src.data()[i];
        if (!std::isfinite(v) || (nodata && v == *nodata)) {
            values.data()[i] = 0.0f;
            mask.data()[i] = 0.0f;
            any_invalid = true;
        } else {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }

    const float fill = nodata ? *nodata : std::numeric_limits<float>::quiet_NaN();
    if (lo > hi) {
        return Matrix2Df::Constant(rows, cols, fill);
    }

    Matrix2Df out = resize_plane(values, rows, cols, interpolation);
    if (method == Resampling::BICUBIC) {
        out = out.cwiseMax(lo).cwiseMin(hi);
    }
    if (any_invalid) {
        const Matrix2Df weights = resize_plane(mask, rows, cols, interpolation);
        for (Eigen::Index i = 0; i < out.size(); ++i) {
            if (weights.data()[i] < kFullMask) {
                out.data()[i] = fill;
            }
        }
    }
    return out;
}

} // namespace pan_series::geo
