#include "pan_series/fusion/pan_sharpen.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/parallel.hpp"

#include <cmath>
#include <set>

namespace pan_series::fusion {

namespace {

void check_params(const model::RasterStack& stack, const PanSharpenParams& p) {
    const std::set<std::string> distinct{p.red, p.green, p.blue, p.pan};
    if (distinct.size() != 4) {
        throw FusionError("red, green, blue and pan must name four different bands");
    }
    for (const auto* name : {&p.red, &p.green, &p.blue, &p.pan}) {
        if (!stack.has_band(*name)) {
            throw FusionError("stack has no band '" + *name + "'");
        }
    }
    if (p.weights.r < 0.0f || p.weights.g < 0.0f || p.weights.b < 0.0f) {
        throw FusionError("weights must be >= 0");
    }
    if (!(p.weights.r + p.weights.g + p.weights.b > 0.0f)) {
        throw FusionError("weights must not sum to zero");
    }
    if (!(p.scale > 0.0f) || !std::isfinite(p.scale)) {
        throw FusionError("scale must be a positive number");
    }
}

void check_aligned(const model::Scene& scene, const PanSharpenParams& p) {
    const Matrix2Df& pan = scene.band(p.pan);
    for (const auto* name : {&p.red, &p.green, &p.blue}) {
        const Matrix2Df& m = scene.band(*name);
        if (m.rows() != pan.rows() || m.cols() != pan.cols()) {
            RequestContext ctx;
            ctx.timestamp = scene.timestamp;
            throw FusionError("band '" + *name + "' is " + std::to_string(m.rows()) + "x" +
                                  std::to_string(m.cols()) + " but '" + p.pan + "' is " +
                                  std::to_string(pan.rows()) + "x" + std::to_string(pan.cols()),
                              ctx);
        }
    }
}

} // namespace

model::RasterStack sharpen(const model::RasterStack& stack, const PanSharpenParams& params, int workers) {
    check_params(stack, params);
    for (const auto& scene : stack.scenes()) {
        check_aligned(scene, params);
    }

    const float nd_r = stack.nodata_for(params.red);
    const float nd_g = stack.nodata_for(params.green);
    const float nd_b = stack.nodata_for(params.blue);
    const float nd_pan = stack.nodata_for(params.pan);
    const float weight_sum = params.weights.r + params.weights.g + params.weights.b;

    std::vector<model::Scene> out(stack.size());

    core::run_parallel(stack.size(), core::compute_worker_count(workers, stack.size()), [&](size_t i) {
        const model::Scene& scene = stack.scenes()[i];
        const Matrix2Df& R = scene.band(params.red);
        const Matrix2Df& G = scene.band(params.green);
        const Matrix2Df& B = scene.band(params.blue);
        const Matrix2Df& P = scene.band(params.pan);

        const Eigen::Index rows = P.rows();
        const Eigen::Index cols = P.cols();
        Matrix2Df r_out(rows, cols), g_out(rows, cols), b_out(rows, cols);

        for (Eigen::Index y = 0; y < rows; ++y) {
            for (Eigen::Index x = 0; x < cols; ++x) {
                const float r = R(y, x);
                const float g = G(y, x);
                const float b = B(y, x);
                const float pan = P(y, x);

                const bool valid = std::isfinite(r) && std::isfinite(g) && std::isfinite(b) &&
                                   std::isfinite(pan) && r != nd_r && g != nd_g && b != nd_b &&
                                   pan != nd_pan;
                const float weight = valid ? (params.weights.r * r + params.weights.g * g +
                                              params.weights.b * b) / weight_sum
                                           : 0.0f;
                if (!(weight > 0.0f)) {
                    r_out(y, x) = nd_r;
                    g_out(y, x) = nd_g;
                    b_out(y, x) = nd_b;
                    continue;
                }

                const float ratio = pan / weight;
                r_out(y, x) = (r / params.scale) * ratio;
                g_out(y, x) = (g / params.scale) * ratio;
                b_out(y, x) = (b / params.scale) * ratio;
            }
        }

        model::Scene fused;
        fused.timestamp = scene.timestamp;
        fused.cloud_coverage = scene.cloud_coverage;
        fused.bands.emplace(params.red, std::move(r_out));
        fused.bands.emplace(params.green, std::move(g_out));
        fused.bands.emplace(params.blue, std::move(b_out));
        out[i] = std::move(fused);
    });

    return model::RasterStack(std::move(out), stack.grid(),
                              {params.red, params.green, params.blue},
                              {{params.red, nd_r}, {params.green, nd_g}, {params.blue, nd_b}});
}

} // namespace pan_series::fusion
