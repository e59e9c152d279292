#pragma once

#include "bdsm/pipeline/op.hpp"

#include <utility>

namespace bdsm::ops {

// Reads opts.filename and collapses the frequency axis into the "image"
// map (and ch0_Q/U/V when polarisation_do is set).
class OpReadImage : public pipeline::Op {
public:
    std::string name() const override { return "readimage"; }
    std::vector<std::string> depends_on() const override;
    pipeline::OpOutputs provides() const override;
    void run(image::Image& img) override;
};

// Builds ch0 from image: blank pixels go into the mask and are zeroed.
class OpCollapse : public pipeline::Op {
public:
    std::string name() const override { return "collapse"; }
    std::vector<std::string> depends_on() const override;
    pipeline::OpOutputs provides() const override;
    void run(image::Image& img) override;
};

// Image statistics and detection thresholds.
class OpPreprocess : public pipeline::Op {
public:
    std::string name() const override { return "preprocess"; }
    std::vector<std::string> depends_on() const override;
    pipeline::OpOutputs provides() const override;
    void run(image::Image& img) override;
};

// Background mean and rms maps.
class OpRmsMap : public pipeline::Op {
public:
    std::string name() const override { return "rmsmap"; }
    std::vector<std::string> depends_on() const override;
    pipeline::OpOutputs provides() const override;
    void run(image::Image& img) override;
};

// Box size and step used for rms/mean maps when rms_box is not given.
std::pair<int, int> default_rms_box(int height, int width);

// Clipped statistics on a grid of boxes; each pixel takes the values of
// the nearest box centre.
std::pair<Matrix2Dd, Matrix2Dd> box_background(const Matrix2Dd& data, const MaskArray* mask,
                                               int box, int step, double kappa);

} // namespace bdsm::ops
