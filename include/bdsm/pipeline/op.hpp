#pragma once

#include "bdsm/core/types.hpp"
#include "bdsm/image/stage_results.hpp"

#include <string>
#include <vector>

namespace bdsm::image {
class Image;
}

namespace bdsm::pipeline {

// What a stage adds to the Image. Cleared before the stage is re-run.
struct OpOutputs {
    std::vector<MapId> maps;
    std::vector<image::ResultField> fields;
};

/**
 * Common base class for all processing stages.
 */
class Op {
public:
    virtual ~Op() = default;

    virtual std::string name() const = 0;

    /**
     * Option names whose change requires this stage (and every later one)
     * to run again.
     */
    virtual std::vector<std::string> depends_on() const = 0;

    virtual OpOutputs provides() const = 0;

    virtual void run(image::Image& img) = 0;
};

} // namespace bdsm::pipeline
