#include "bdsm/ops/builtin_ops.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>

namespace bdsm::ops {

std::vector<std::string> OpRmsMap::depends_on() const {
    return {"rms_box", "rms_map", "mean_map", "kappa_clip"};
}

pipeline::OpOutputs OpRmsMap::provides() const {
    return {{MapId::RMS, MapId::MEAN, MapId::RMS_QUV, MapId::MEAN_QUV}, {}};
}

std::pair<int, int> default_rms_box(int height, int width) {
    const int smallest = std::min(height, width);
    const int box = std::max(2, std::min(std::max(16, smallest / 8), smallest));
    const int step = std::max(1, box / 3);
    return {box, step};
}

namespace {

// Box centres along one axis: first box flush with the edge, last box flush
// with the opposite edge.
std::vector<int> box_centres(int n, int box, int step) {
    std::vector<int> c;
    const int half = box / 2;
    if (n <= box) {
        c.push_back(n / 2);
        return c;
    }
    for (int p = half; p - half + box <= n; p += step) {
        c.push_back(p);
    }
    if (c.back() - half + box < n) {
        c.push_back(n - box + half);
    }
    return c;
}

std::vector<int> nearest_centre(int n, const std::vector<int>& centres) {
    std::vector<int> idx(static_cast<std::size_t>(n), 0);
    std::size_t k = 0;
    for (int i = 0; i < n; ++i) {
        while (k + 1 < centres.size() &&
               std::abs(centres[k + 1] - i) <= std::abs(centres[k] - i)) {
            ++k;
        }
        idx[static_cast<std::size_t>(i)] = static_cast<int>(k);
    }
    return idx;
}

} // namespace

std::pair<Matrix2Dd, Matrix2Dd> box_background(const Matrix2Dd& data, const MaskArray* mask,
                                               int box, int step, double kappa) {
    const int h = static_cast<int>(data.rows());
    const int w = static_cast<int>(data.cols());
    if (box < 2 || step < 1) {
        throw ValidationError("rms_box must have size >= 2 and step >= 1");
    }

    std::vector<double> all = core::unmasked_values(data, mask);
    if (all.empty()) {
        throw PipelineError("no unmasked pixels for background estimation");
    }
    const core::ClippedStats global = core::sigma_clip(std::move(all), kappa);

    const std::vector<int> cy = box_centres(h, box, step);
    const std::vector<int> cx = box_centres(w, box, step);
    const int half = box / 2;

    const auto ny = static_cast<Eigen::Index>(cy.size());
    const auto nx = static_cast<Eigen::Index>(cx.size());
    Matrix2Dd grid_mean(ny, nx);
    Matrix2Dd grid_rms(ny, nx);
    for (std::size_t i = 0; i < cy.size(); ++i) {
        for (std::size_t j = 0; j < cx.size(); ++j) {
            const int y0 = std::max(0, cy[i] - half);
            const int x0 = std::max(0, cx[j] - half);
            const int bh = std::min(box, h - y0);
            const int bw = std::min(box, w - x0);
            std::vector<double> vals = core::unmasked_values(data, mask, y0, x0, bh, bw);
            // Boxes with too few usable pixels fall back to the global values.
            if (vals.size() < 2) {
                grid_mean(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = global.mean;
                grid_rms(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = global.rms;
                continue;
            }
            const core::ClippedStats s = core::sigma_clip(std::move(vals), kappa);
            grid_mean(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = s.mean;
            grid_rms(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = s.rms;
        }
    }

    const std::vector<int> iy = nearest_centre(h, cy);
    const std::vector<int> ix = nearest_centre(w, cx);
    Matrix2Dd mean(h, w);
    Matrix2Dd rms(h, w);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            mean(y, x) = grid_mean(iy[y], ix[x]);
            rms(y, x) = grid_rms(iy[y], ix[x]);
        }
    }
    return {mean, rms};
}

namespace {

struct Background {
    Matrix2Dd mean;
    Matrix2Dd rms;
};

Background compute_background(const Matrix2Dd& data, const MaskArray* mask,
                              const config::Options& opts, bool use_map,
                              int box, int step, double const_mean, double const_rms) {
    Background bg;
    const Eigen::Index h = data.rows();
    const Eigen::Index w = data.cols();

    std::optional<std::pair<Matrix2Dd, Matrix2Dd>> boxed;
    auto boxes = [&]() -> const std::pair<Matrix2Dd, Matrix2Dd>& {
        if (!boxed) boxed = box_background(data, mask, box, step, opts.kappa_clip);
        return *boxed;
    };

    if (use_map) {
        bg.rms = boxes().second;
    } else {
        bg.rms = Matrix2Dd::Constant(h, w, const_rms);
    }

    if (opts.mean_map == "zero") {
        bg.mean = Matrix2Dd::Zero(h, w);
    } else if (opts.mean_map == "const") {
        bg.mean = Matrix2Dd::Constant(h, w, const_mean);
    } else if (opts.mean_map == "map" || use_map) {
        bg.mean = boxes().first;
    } else {
        bg.mean = Matrix2Dd::Constant(h, w, const_mean);
    }
    return bg;
}

} // namespace

void OpRmsMap::run(image::Image& img) {
    const config::Options& opts = img.opts();
    const auto& res = img.results();
    if (!res.clipped_mean || !res.clipped_rms) {
        throw PipelineError("rmsmap needs the image statistics from preprocess");
    }

    const Matrix2Dd ch0 = img.get_map(MapId::CH0);
    const bool use_map = opts.rms_map ? *opts.rms_map : opts.rms_box.has_value();

    std::pair<int, int> box_step = opts.rms_box
        ? std::make_pair((*opts.rms_box)[0], (*opts.rms_box)[1])
        : default_rms_box(static_cast<int>(ch0.rows()), static_cast<int>(ch0.cols()));

    Background bg = compute_background(ch0, img.mask(), opts, use_map,
                                       box_step.first, box_step.second,
                                       *res.clipped_mean, *res.clipped_rms);
    img.put_map(MapId::RMS, bg.rms);
    img.put_map(MapId::MEAN, bg.mean);

    if (opts.polarisation_do && img.has_map(MapId::CH0_V)) {
        const Matrix2Dd v = img.get_map(MapId::CH0_V);
        std::vector<double> vals = core::unmasked_values(v, img.mask());
        if (vals.empty()) {
            throw PipelineError("no unmasked pixels in ch0_V");
        }
        const core::ClippedStats s = core::sigma_clip(std::move(vals), opts.kappa_clip);
        Background qu = compute_background(v, img.mask(), opts, use_map,
                                           box_step.first, box_step.second, s.mean, s.rms);
        img.put_map(MapId::RMS_QUV, qu.rms);
        img.put_map(MapId::MEAN_QUV, qu.mean);
    }

    if (!img.opts().quiet) {
        if (use_map) {
            std::cerr << "[RMSMAP] Using box " << box_step.first << ", step " << box_step.second
                      << " for the background maps" << std::endl;
        } else {
            std::cerr << "[RMSMAP] Using constant background (mean " << *res.clipped_mean
                      << ", rms " << *res.clipped_rms << ")" << std::endl;
        }
    }
}

} // namespace bdsm::ops
