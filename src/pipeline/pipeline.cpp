#include "bdsm/pipeline/pipeline.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/events.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/ops/builtin_ops.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>

namespace bdsm::pipeline {

using json = nlohmann::json;

std::shared_ptr<Pipeline> Pipeline::default_chain() {
    auto p = std::make_shared<Pipeline>();
    p->add_op(std::make_shared<ops::OpReadImage>());
    p->add_op(std::make_shared<ops::OpCollapse>());
    p->add_op(std::make_shared<ops::OpPreprocess>());
    p->add_op(std::make_shared<ops::OpRmsMap>());
    return p;
}

void Pipeline::add_op(std::shared_ptr<Op> op) {
    if (!op) {
        throw PipelineError("cannot add a null op");
    }
    const std::string name = op->name();
    for (const auto& existing : ops_) {
        if (existing->name() == name) {
            throw PipelineError("op '" + name + "' is already part of the pipeline");
        }
    }
    ops_.push_back(std::move(op));
}

std::size_t Pipeline::first_stale_op(const image::Image& img) const {
    const auto& prev = img.prev_opts();
    if (!prev) {
        return 0;
    }

    const auto changed = config::diff_options(*prev, img.opts());
    const auto& done = img.completed_ops();

    for (std::size_t i = 0; i < ops_.size(); ++i) {
        if (i >= done.size() || done[i] != ops_[i]->name()) {
            return i;
        }
        for (const auto& dep : ops_[i]->depends_on()) {
            if (std::find(changed.begin(), changed.end(), dep) != changed.end()) {
                return i;
            }
        }
    }
    return ops_.size();
}

void Pipeline::reset_outputs(image::Image& img, std::size_t from) const {
    for (std::size_t i = from; i < ops_.size(); ++i) {
        const OpOutputs out = ops_[i]->provides();
        for (MapId id : out.maps) {
            img.clear_map(id);
        }
        for (image::ResultField field : out.fields) {
            img.results().clear(field);
        }
    }
}

ProcessReport Pipeline::run(image::Image& img, const std::string& run_id, std::ostream* log_stream) {
    ProcessReport report;
    report.run_id = run_id;

    core::EventEmitter emitter;
    const bool quiet = img.opts().quiet;
    const std::size_t start = first_stale_op(img);

    if (log_stream) {
        emitter.run_start(run_id, {
            {"filename", img.opts().filename},
            {"n_ops", static_cast<int>(ops_.size())},
            {"first_op", static_cast<int>(start)},
            {"do_cache", img.do_cache()}
        }, *log_stream);
    }

    for (std::size_t i = 0; i < start && i < ops_.size(); ++i) {
        report.ops_skipped.push_back(ops_[i]->name());
        if (log_stream) {
            emitter.op_skipped(run_id, static_cast<int>(i), ops_[i]->name(), *log_stream);
        }
    }

    if (start < ops_.size()) {
        reset_outputs(img, start);
        img.truncate_completed(start);
    } else {
        if (log_stream) {
            emitter.warning(run_id, "nothing to do: all ops completed with the current options", *log_stream);
        }
        if (!quiet) {
            std::cerr << "[PIPE] Nothing to do: all ops completed with the current options" << std::endl;
        }
    }

    for (std::size_t i = start; i < ops_.size(); ++i) {
        const auto& op = ops_[i];
        const std::string name = op->name();
        if (log_stream) {
            emitter.op_start(run_id, static_cast<int>(i), name, *log_stream);
        }
        if (img.opts().debug) {
            std::cerr << "[PIPE] Running " << name << std::endl;
        }

        try {
            op->run(img);
        } catch (const std::exception& e) {
            if (log_stream) {
                emitter.op_end(run_id, static_cast<int>(i), name, "error", {{"error", e.what()}}, *log_stream);
                emitter.error(run_id, e.what(), *log_stream);
                emitter.run_end(run_id, false, "error", *log_stream);
            }
            if (!quiet) {
                std::cerr << "[PIPE] " << name << " failed: " << e.what() << std::endl;
            }
            throw;
        }

        img.mark_completed(name);
        report.ops_run.push_back(name);
        if (log_stream) {
            emitter.op_end(run_id, static_cast<int>(i), name, "ok", json::object(), *log_stream);
        }
    }

    img.set_prev_opts(img.opts());

    if (log_stream) {
        emitter.run_end(run_id, true, "ok", *log_stream);
    }
    if (!quiet) {
        std::cerr << "[PIPE] Ran " << report.ops_run.size() << " op(s), skipped "
                  << report.ops_skipped.size() << std::endl;
    }
    return report;
}

} // namespace bdsm::pipeline
