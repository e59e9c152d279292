#include "bdsm/ops/builtin_ops.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace bdsm::ops {

using image::ResultField;

// Area of a Gaussian beam in units of bmaj * bmin: 2 pi / (8 ln 2)
static constexpr double kGaussianBeamFactor = 1.1331;

std::vector<std::string> OpPreprocess::depends_on() const {
    return {"kappa_clip", "thresh_pix", "thresh_isl", "minpix_isl"};
}

pipeline::OpOutputs OpPreprocess::provides() const {
    return {
        {},
        {ResultField::THRESH_PIX, ResultField::MINPIX_ISL, ResultField::CLIPPED_MEAN,
         ResultField::CLIPPED_RMS, ResultField::RAW_MEAN, ResultField::RAW_RMS,
         ResultField::MAX_VALUE, ResultField::MIN_VALUE, ResultField::PIXEL_BEAMAREA}
    };
}

static std::optional<double> pixel_beam_area(const image::Image& img) {
    const auto& beam = img.results().beam;
    auto cdelt1 = img.header().get_number("CDELT1");
    auto cdelt2 = img.header().get_number("CDELT2");
    if (!beam || !cdelt1 || !cdelt2 || *cdelt1 == 0.0 || *cdelt2 == 0.0) {
        return std::nullopt;
    }
    const double pix = std::sqrt(std::fabs(*cdelt1 * *cdelt2));
    return kGaussianBeamFactor * (beam->bmaj / pix) * (beam->bmin / pix);
}

void OpPreprocess::run(image::Image& img) {
    const config::Options& opts = img.opts();
    const Matrix2Dd ch0 = img.get_map(MapId::CH0);

    std::vector<double> values = core::unmasked_values(ch0, img.mask());
    if (values.empty()) {
        throw PipelineError("no unmasked pixels in ch0");
    }

    auto& res = img.results();
    res.raw_mean = core::mean_of(values);
    res.raw_rms = core::stddev_of(values);
    const auto [mn, mx] = std::minmax_element(values.begin(), values.end());
    res.min_value = *mn;
    res.max_value = *mx;

    const core::ClippedStats clipped = core::sigma_clip(std::move(values), opts.kappa_clip);
    res.clipped_mean = clipped.mean;
    res.clipped_rms = clipped.rms;
    res.thresh_pix = opts.thresh_pix;

    const auto area = pixel_beam_area(img);
    if (area) {
        res.pixel_beamarea = *area;
    }
    if (opts.minpix_isl) {
        res.minpix_isl = *opts.minpix_isl;
    } else if (area) {
        res.minpix_isl = std::max(6, static_cast<int>(*area / 3.0));
    } else {
        res.minpix_isl = 6;
    }

    if (!opts.quiet) {
        std::cerr << "[PREPROCESS] clipped mean " << clipped.mean << ", clipped rms " << clipped.rms
                  << " (" << clipped.iterations << " iteration(s)), minpix_isl " << *res.minpix_isl
                  << std::endl;
    }
}

} // namespace bdsm::ops
