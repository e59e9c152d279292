#include "bdsm/ops/builtin_ops.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/image/image.hpp"

#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

namespace bdsm::ops {

std::vector<std::string> OpCollapse::depends_on() const {
    return {"blank_limit"};
}

pipeline::OpOutputs OpCollapse::provides() const {
    return {{MapId::CH0}, {}};
}

void OpCollapse::run(image::Image& img) {
    const config::Options& opts = img.opts();
    Matrix2Dd ch0 = img.get_map(MapId::IMAGE);

    std::vector<std::pair<MapId, Matrix2Dd>> pol;
    for (MapId id : {MapId::CH0_Q, MapId::CH0_U, MapId::CH0_V}) {
        if (!img.has_map(id)) continue;
        Matrix2Dd plane = img.get_map(id);
        if (plane.rows() != ch0.rows() || plane.cols() != ch0.cols()) {
            throw PipelineError("Stokes plane " + map_id_to_string(id) +
                                " does not match the image shape");
        }
        pol.emplace_back(id, std::move(plane));
    }

    MaskArray mask = MaskArray::Constant(ch0.rows(), ch0.cols(), false);
    for (Eigen::Index y = 0; y < ch0.rows(); ++y) {
        for (Eigen::Index x = 0; x < ch0.cols(); ++x) {
            const double v = ch0(y, x);
            bool blank = !std::isfinite(v) ||
                         (opts.blank_limit && std::fabs(v) < *opts.blank_limit);
            for (const auto& plane : pol) {
                blank = blank || !std::isfinite(plane.second(y, x));
            }
            mask(y, x) = blank;
        }
    }

    const long nblank = static_cast<long>(mask.count());
    if (nblank == ch0.size()) {
        throw PipelineError("all pixels of the image are blanked");
    }

    // Masked pixels are zeroed in I, Q, U and V alike.
    ch0 = mask.select(Matrix2Dd::Zero(ch0.rows(), ch0.cols()), ch0);
    img.put_map(MapId::CH0, ch0);
    for (auto& plane : pol) {
        if (nblank > 0) {
            plane.second = mask.select(Matrix2Dd::Zero(ch0.rows(), ch0.cols()), plane.second);
            img.put_map(plane.first, plane.second);
        }
    }

    if (nblank > 0) {
        img.set_mask(std::move(mask));
    } else {
        img.clear_mask();
    }

    if (!opts.quiet && nblank > 0) {
        std::cerr << "[COLLAPSE] " << nblank << " blank pixel(s) masked" << std::endl;
    }
}

} // namespace bdsm::ops
