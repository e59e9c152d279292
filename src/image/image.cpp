#include "bdsm/image/image.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/interface/interface.hpp"
#include "bdsm/interface/viewer.hpp"
#include "bdsm/pipeline/pipeline.hpp"

#include <algorithm>
#include <iostream>

namespace bdsm::image {

Image::Image(const config::Options& opts)
    : id_(core::make_instance_id()),
      opts_(opts),
      console_(&std::cout) {
    if (opts_.do_cache) {
        set_do_cache(true);
    }
}

Image::~Image() = default;

// --- Map cache indirection ---

MapId Image::resolve_map_name(const std::string& name) const {
    auto id = string_to_map_id(name);
    if (!id) {
        throw ValidationError("unknown map '" + name + "'");
    }
    return *id;
}

std::string Image::make_cache_key(MapId id, int j, bool pi) {
    std::string key = "w" + std::to_string(j) + "_" + map_id_to_string(id);
    if (pi) {
        key += "_pi";
    }
    return key;
}

std::string Image::cache_key(MapId id) const {
    return make_cache_key(id, j_, pi_);
}

void Image::rekey_store(int j, bool pi) {
    if (!store_) {
        return;
    }
    for (MapId id : all_map_ids()) {
        const std::string from = make_cache_key(id, j_, pi_);
        const std::string to = make_cache_key(id, j, pi);
        if (from == to || !store_->contains(from)) continue;
        store_->store(to, store_->retrieve(from));
        store_->remove(from);
    }
}

void Image::set_pi(bool v) {
    rekey_store(j_, v);
    pi_ = v;
}

void Image::set_wavelet_scale(int j) {
    rekey_store(j, pi_);
    j_ = j;
}

Matrix2Dd Image::get_map(MapId id) const {
    if (do_cache_ && store_) {
        return store_->retrieve(cache_key(id));
    }
    const auto& slot = maps_[static_cast<std::size_t>(map_id_to_int(id))];
    if (!slot) {
        throw NotFoundError("Image has no attribute '" + map_id_to_string(id) + "'");
    }
    return *slot;
}

Matrix2Dd Image::get_map(const std::string& name) const {
    return get_map(resolve_map_name(name));
}

void Image::put_map(MapId id, const Matrix2Dd& data) {
    auto& slot = maps_[static_cast<std::size_t>(map_id_to_int(id))];
    if (do_cache_ && store_) {
        store_->store(cache_key(id), data);
        slot = get_map(id);
        if (opts_.debug) {
            std::cerr << "[CACHE] " << cache_key(id) << " stored via "
                      << store_->backend_name() << std::endl;
        }
        return;
    }
    slot = data;
}

void Image::put_map(const std::string& name, const Matrix2Dd& data) {
    put_map(resolve_map_name(name), data);
}

bool Image::has_map(MapId id) const {
    if (maps_[static_cast<std::size_t>(map_id_to_int(id))]) {
        return true;
    }
    return do_cache_ && store_ && store_->contains(cache_key(id));
}

void Image::clear_map(MapId id) {
    maps_[static_cast<std::size_t>(map_id_to_int(id))].reset();
    if (store_) {
        store_->remove(cache_key(id));
    }
}

std::vector<MapId> Image::available_maps() const {
    std::vector<MapId> out;
    for (MapId id : all_map_ids()) {
        if (has_map(id)) {
            out.push_back(id);
        }
    }
    return out;
}

const std::optional<Matrix2Dd>& Image::map_slot(MapId id) const {
    return maps_[static_cast<std::size_t>(map_id_to_int(id))];
}

void Image::set_do_cache(bool enable) {
    if (!enable) {
        do_cache_ = false;
        opts_.do_cache = false;
        store_.reset();
        return;
    }
    if (do_cache_ && store_) {
        return;
    }

    store_ = store::make_map_store(opts_, id_);
    do_cache_ = true;
    opts_.do_cache = true;
    try {
        for (MapId id : all_map_ids()) {
            const auto& slot = maps_[static_cast<std::size_t>(map_id_to_int(id))];
            if (slot) {
                Matrix2Dd data = *slot;
                put_map(id, data);
            }
        }
    } catch (...) {
        do_cache_ = false;
        opts_.do_cache = false;
        store_.reset();
        throw;
    }

    if (!opts_.quiet) {
        std::cerr << "[CACHE] Map caching enabled (" << store_->backend_name() << ")" << std::endl;
    }
}

// --- Metadata and bookkeeping ---

void Image::set_mask(MaskArray mask) {
    mask_ = std::move(mask);
    masked_ = true;
}

void Image::clear_mask() {
    mask_.resize(0, 0);
    masked_ = false;
}

void Image::mark_completed(const std::string& op_name) {
    completed_ops_.push_back(op_name);
}

void Image::truncate_completed(std::size_t count) {
    if (count < completed_ops_.size()) {
        completed_ops_.resize(count);
    }
}

bool Image::is_completed(const std::string& op_name) const {
    return std::find(completed_ops_.begin(), completed_ops_.end(), op_name) != completed_ops_.end();
}

// --- Cross-process handoff ---

HandoffState Image::get_state() const {
    if (!results_.thresh_pix || !results_.minpix_isl || !results_.clipped_mean) {
        throw PipelineError("handoff state is not available before preprocess has run");
    }
    HandoffState state;
    state.thresh_pix = *results_.thresh_pix;
    state.minpix_isl = *results_.minpix_isl;
    state.clipped_mean = *results_.clipped_mean;
    return state;
}

void Image::set_state(const HandoffState& state) {
    results_.thresh_pix = state.thresh_pix;
    results_.minpix_isl = state.minpix_isl;
    results_.clipped_mean = state.clipped_mean;
}

// --- Delegated operations ---

bool Image::surface(const core::Status& status) const {
    if (status.success) {
        return true;
    }
    if (interactive_) {
        console() << "\n\033[31;1mERROR\033[0m: " << status.error_message << std::endl;
        return false;
    }
    throw std::runtime_error(status.error_message);
}

void Image::list_pars() const {
    interface::list_pars(*this, console());
}

bool Image::set_pars(const YAML::Node& overrides) {
    return surface(core::run_guarded([&] { interface::set_pars(*this, overrides); }));
}

bool Image::process(const YAML::Node& overrides) {
    return surface(core::run_guarded([&] { interface::process(*this, overrides); }));
}

bool Image::save_pars(const std::string& savefile) const {
    return surface(core::run_guarded([&] { interface::save_pars(*this, savefile); }));
}

bool Image::load_pars(const std::string& loadfile) {
    return surface(core::run_guarded([&] { interface::load_pars(*this, loadfile); }));
}

bool Image::show_fit(const YAML::Node& options) {
    if (!results_.nisl) {
        console() << "Image has not been processed. Please run process first." << std::endl;
        return false;
    }
    if (!viewer_) {
        viewer_ = std::make_shared<interface::SummaryViewer>();
    }
    return surface(core::run_guarded([&] { viewer_->show(*this, options); }));
}

std::optional<fs::path> Image::export_image(const YAML::Node& overrides) {
    fs::path written;
    if (!surface(core::run_guarded([&] { written = interface::export_image(*this, overrides); }))) {
        return std::nullopt;
    }
    return written;
}

std::optional<fs::path> Image::write_catalog(const YAML::Node& overrides) {
    fs::path written;
    if (!surface(core::run_guarded([&] { written = interface::write_catalog(*this, overrides); }))) {
        return std::nullopt;
    }
    return written;
}

// --- Collaborators ---

void Image::set_viewer(std::shared_ptr<interface::ResultsViewer> viewer) {
    viewer_ = std::move(viewer);
}

void Image::set_pipeline(std::shared_ptr<pipeline::Pipeline> pipeline) {
    pipeline_ = std::move(pipeline);
}

pipeline::Pipeline& Image::pipeline() {
    if (!pipeline_) {
        pipeline_ = pipeline::Pipeline::default_chain();
    }
    return *pipeline_;
}

} // namespace bdsm::image
