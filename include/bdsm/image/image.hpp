#pragma once

#include "bdsm/config/options.hpp"
#include "bdsm/core/status.hpp"
#include "bdsm/core/types.hpp"
#include "bdsm/image/handoff.hpp"
#include "bdsm/image/stage_results.hpp"
#include "bdsm/io/fits_io.hpp"
#include "bdsm/store/map_store.hpp"

#include <array>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace bdsm::pipeline {
class Pipeline;
}

namespace bdsm::interface {
class ResultsViewer;
}

namespace bdsm::image {

/**
 * Primary data container of the source finder.
 *
 * Holds the image maps, header, mask, user options and everything the
 * processing stages produce. Maps must be written with put_map() so that
 * they can be spilled to a MapStore transparently when caching is on:
 *
 *     img.put_map(MapId::CH0, ch0);
 *     Matrix2Dd ch0 = img.get_map(MapId::CH0);
 *
 * Updates to a map must go through put_map() again.
 *
 * The convenience methods at the bottom (list_pars, process, export_image,
 * ...) delegate to bdsm::interface. Their failures are printed when the
 * image is used from the interactive shell and rethrown as
 * std::runtime_error otherwise.
 */
class Image {
public:
    explicit Image(const config::Options& opts);
    ~Image();

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    const std::string& id() const { return id_; }

    // --- Map cache indirection ---

    Matrix2Dd get_map(MapId id) const;
    Matrix2Dd get_map(const std::string& name) const;

    void put_map(MapId id, const Matrix2Dd& data);
    void put_map(const std::string& name, const Matrix2Dd& data);

    bool has_map(MapId id) const;
    void clear_map(MapId id);
    std::vector<MapId> available_maps() const;

    // In-memory view of a map; mirrors the store while caching is on.
    const std::optional<Matrix2Dd>& map_slot(MapId id) const;

    // Store key: "w<j>_<name>", "_pi" appended for polarized intensity images.
    std::string cache_key(MapId id) const;

    bool do_cache() const { return do_cache_; }
    void set_do_cache(bool enable);
    const store::MapStore* map_store() const { return store_.get(); }

    // --- Metadata and bookkeeping ---

    io::FitsHeader& header() { return header_; }
    const io::FitsHeader& header() const { return header_; }

    void set_mask(MaskArray mask);
    void clear_mask();
    bool masked() const { return masked_; }
    const MaskArray* mask() const { return masked_ ? &mask_ : nullptr; }

    config::Options& opts() { return opts_; }
    const config::Options& opts() const { return opts_; }

    const std::optional<config::Options>& prev_opts() const { return prev_opts_; }
    void set_prev_opts(std::optional<config::Options> opts) { prev_opts_ = std::move(opts); }

    const std::vector<std::string>& completed_ops() const { return completed_ops_; }
    void mark_completed(const std::string& op_name);
    void truncate_completed(std::size_t count);
    bool is_completed(const std::string& op_name) const;

    StageResults& results() { return results_; }
    const StageResults& results() const { return results_; }

    std::map<std::string, std::string>& extraparams() { return extraparams_; }
    const std::map<std::string, std::string>& extraparams() const { return extraparams_; }

    const std::string& basedir() const { return basedir_; }
    void set_basedir(const std::string& dir) { basedir_ = dir; }
    bool waveletimage() const { return waveletimage_; }
    void set_waveletimage(bool v) { waveletimage_ = v; }
    // Changing pi or the wavelet scale moves cached maps to their new keys.
    bool pi() const { return pi_; }
    void set_pi(bool v);
    int wavelet_scale() const { return j_; }
    void set_wavelet_scale(int j);
    bool interactive() const { return interactive_; }
    void set_interactive(bool v) { interactive_ = v; }

    // --- Cross-process handoff ---

    HandoffState get_state() const;
    void set_state(const HandoffState& state);

    // --- Delegated operations ---

    void list_pars() const;
    bool set_pars(const YAML::Node& overrides);
    bool process(const YAML::Node& overrides = YAML::Node());
    bool save_pars(const std::string& savefile = "") const;
    bool load_pars(const std::string& loadfile = "");
    bool show_fit(const YAML::Node& options = YAML::Node());
    std::optional<fs::path> export_image(const YAML::Node& overrides = YAML::Node());
    std::optional<fs::path> write_catalog(const YAML::Node& overrides = YAML::Node());

    // --- Collaborators ---

    void set_console(std::ostream& out) { console_ = &out; }
    std::ostream& console() const { return *console_; }
    void set_log_stream(std::ostream* log) { log_stream_ = log; }
    std::ostream* log_stream() const { return log_stream_; }
    void set_viewer(std::shared_ptr<interface::ResultsViewer> viewer);
    void set_pipeline(std::shared_ptr<pipeline::Pipeline> pipeline);
    pipeline::Pipeline& pipeline();

private:
    MapId resolve_map_name(const std::string& name) const;
    static std::string make_cache_key(MapId id, int j, bool pi);
    void rekey_store(int j, bool pi);
    bool surface(const core::Status& status) const;

    std::string id_;
    config::Options opts_;
    std::optional<config::Options> prev_opts_;

    std::array<std::optional<Matrix2Dd>, kMapCount> maps_;
    bool do_cache_ = false;
    std::unique_ptr<store::MapStore> store_;

    io::FitsHeader header_;
    MaskArray mask_;
    bool masked_ = false;

    std::vector<std::string> completed_ops_;
    StageResults results_;
    std::map<std::string, std::string> extraparams_;

    std::string basedir_ = "DUMMY";
    bool waveletimage_ = false;
    bool pi_ = false;
    int j_ = 0;
    bool interactive_ = false;

    std::ostream* console_;
    std::ostream* log_stream_ = nullptr;
    std::shared_ptr<interface::ResultsViewer> viewer_;
    std::shared_ptr<pipeline::Pipeline> pipeline_;
};

} // namespace bdsm::image
