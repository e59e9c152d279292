#pragma once

#include "bdsm/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bdsm::image {

// Scalar and list products added to an Image by processing stages.
enum class ResultField {
    THRESH_PIX,
    MINPIX_ISL,
    CLIPPED_MEAN,
    CLIPPED_RMS,
    RAW_MEAN,
    RAW_RMS,
    MAX_VALUE,
    MIN_VALUE,
    BEAM,
    PIXEL_BEAMAREA,
    FREQUENCY,
    NCHAN,
    NISL,
    ISLANDS,
    GAUSSIANS,
    SOURCES
};

struct StageResults {
    std::optional<double> thresh_pix;
    std::optional<int> minpix_isl;
    std::optional<double> clipped_mean;
    std::optional<double> clipped_rms;
    std::optional<double> raw_mean;
    std::optional<double> raw_rms;
    std::optional<double> max_value;
    std::optional<double> min_value;
    std::optional<Beam> beam;
    std::optional<double> pixel_beamarea; // beam area in pixels
    std::optional<double> frequency;      // Hz
    std::optional<int> nchan;
    std::optional<int> nisl;
    std::optional<std::vector<Island>> islands;
    std::optional<std::vector<Gaussian>> gaussians;
    std::optional<std::vector<Source>> sources;

    bool has(ResultField field) const;
    void clear(ResultField field);
};

} // namespace bdsm::image
