#pragma once

#include <yaml-cpp/yaml.h>

namespace bdsm::image {
class Image;
}

namespace bdsm::interface {

/**
 * Presents the fit results of a processed Image. Plotting front ends
 * implement this; SummaryViewer is the textual fallback.
 */
class ResultsViewer {
public:
    virtual ~ResultsViewer() = default;
    virtual void show(const image::Image& img, const YAML::Node& options) = 0;
};

// Writes to the console stream of the image being shown.
class SummaryViewer : public ResultsViewer {
public:
    // options: ngaus (int, Gaussians listed, default 10)
    void show(const image::Image& img, const YAML::Node& options) override;
};

} // namespace bdsm::interface
