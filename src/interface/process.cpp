#include "bdsm/interface/interface.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"

namespace bdsm::interface {

pipeline::ProcessReport process(image::Image& img, const YAML::Node& overrides) {
    set_pars(img, overrides);
    if (img.opts().filename.empty()) {
        throw ConfigError("filename is not set");
    }
    return img.pipeline().run(img, core::get_run_id(), img.log_stream());
}

fs::path default_output_path(const config::Options& opts, const std::string& suffix) {
    if (opts.filename.empty()) {
        throw ConfigError("filename is not set; give an output file name");
    }
    const fs::path input(opts.filename);
    std::string stem = input.filename().string();
    const std::string ext = core::to_lower(input.extension().string());
    if (ext == ".fits" || ext == ".fit" || ext == ".fts") {
        stem = input.stem().string();
    }
    const fs::path dir = opts.outdir.empty() ? input.parent_path() : fs::path(opts.outdir);
    return dir / (stem + suffix);
}

} // namespace bdsm::interface
