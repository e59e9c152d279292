#pragma once

#include "bdsm/pipeline/op.hpp"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace bdsm::pipeline {

struct ProcessReport {
    std::string run_id;
    std::vector<std::string> ops_run;
    std::vector<std::string> ops_skipped;
};

/**
 * Ordered chain of stages. A run resumes at the first stage that is not
 * recorded as completed, or whose option dependencies changed since the
 * previous successful run.
 */
class Pipeline {
public:
    Pipeline() = default;

    // readimage -> collapse -> preprocess -> rmsmap
    static std::shared_ptr<Pipeline> default_chain();

    void add_op(std::shared_ptr<Op> op);
    const std::vector<std::shared_ptr<Op>>& ops() const { return ops_; }

    std::size_t first_stale_op(const image::Image& img) const;

    ProcessReport run(image::Image& img, const std::string& run_id, std::ostream* log_stream);

private:
    void reset_outputs(image::Image& img, std::size_t from) const;

    std::vector<std::shared_ptr<Op>> ops_;
};

} // namespace bdsm::pipeline
