#include "bdsm/image/stage_results.hpp"

namespace bdsm::image {

bool StageResults::has(ResultField field) const {
    switch (field) {
        case ResultField::THRESH_PIX: return thresh_pix.has_value();
        case ResultField::MINPIX_ISL: return minpix_isl.has_value();
        case ResultField::CLIPPED_MEAN: return clipped_mean.has_value();
        case ResultField::CLIPPED_RMS: return clipped_rms.has_value();
        case ResultField::RAW_MEAN: return raw_mean.has_value();
        case ResultField::RAW_RMS: return raw_rms.has_value();
        case ResultField::MAX_VALUE: return max_value.has_value();
        case ResultField::MIN_VALUE: return min_value.has_value();
        case ResultField::BEAM: return beam.has_value();
        case ResultField::PIXEL_BEAMAREA: return pixel_beamarea.has_value();
        case ResultField::FREQUENCY: return frequency.has_value();
        case ResultField::NCHAN: return nchan.has_value();
        case ResultField::NISL: return nisl.has_value();
        case ResultField::ISLANDS: return islands.has_value();
        case ResultField::GAUSSIANS: return gaussians.has_value();
        case ResultField::SOURCES: return sources.has_value();
    }
    return false;
}

void StageResults::clear(ResultField field) {
    switch (field) {
        case ResultField::THRESH_PIX: thresh_pix.reset(); break;
        case ResultField::MINPIX_ISL: minpix_isl.reset(); break;
        case ResultField::CLIPPED_MEAN: clipped_mean.reset(); break;
        case ResultField::CLIPPED_RMS: clipped_rms.reset(); break;
        case ResultField::RAW_MEAN: raw_mean.reset(); break;
        case ResultField::RAW_RMS: raw_rms.reset(); break;
        case ResultField::MAX_VALUE: max_value.reset(); break;
        case ResultField::MIN_VALUE: min_value.reset(); break;
        case ResultField::BEAM: beam.reset(); break;
        case ResultField::PIXEL_BEAMAREA: pixel_beamarea.reset(); break;
        case ResultField::FREQUENCY: frequency.reset(); break;
        case ResultField::NCHAN: nchan.reset(); break;
        case ResultField::NISL: nisl.reset(); break;
        case ResultField::ISLANDS: islands.reset(); break;
        case ResultField::GAUSSIANS: gaussians.reset(); break;
        case ResultField::SOURCES: sources.reset(); break;
    }
}

} // namespace bdsm::image
