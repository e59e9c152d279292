#include "bdsm/interface/viewer.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/image/image.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace bdsm::interface {

void SummaryViewer::show(const image::Image& img, const YAML::Node& options) {
    int ngaus = 10;
    if (options && options.IsMap() && options["ngaus"]) {
        try {
            ngaus = options["ngaus"].as<int>();
        } catch (const YAML::Exception&) {
            throw ConfigError("invalid value for show_fit option 'ngaus'");
        }
    }

    std::ostream& out = img.console();
    const auto& res = img.results();
    out << "Image: " << img.opts().filename << "\n";
    if (res.beam) {
        out << "  Beam (deg)          : " << res.beam->bmaj << " x " << res.beam->bmin
             << ", PA " << res.beam->bpa << "\n";
    }
    if (res.frequency) {
        out << "  Frequency (Hz)      : " << *res.frequency << "\n";
    }
    if (res.clipped_mean && res.clipped_rms) {
        out << "  Background          : mean " << *res.clipped_mean
             << ", rms " << *res.clipped_rms << "\n";
    }
    out << "  Islands             : " << res.nisl.value_or(0) << "\n";

    const std::size_t n_gaus = res.gaussians ? res.gaussians->size() : 0;
    out << "  Gaussians           : " << n_gaus << "\n";
    if (res.sources) {
        out << "  Sources             : " << res.sources->size() << "\n";
    }

    if (n_gaus == 0 || ngaus <= 0) {
        out.flush();
        return;
    }

    out << "\n  " << std::setw(6) << "Gaus" << std::setw(6) << "Isl"
         << std::setw(10) << "X" << std::setw(10) << "Y"
         << std::setw(14) << "Peak" << std::setw(14) << "Total" << "\n";
    const std::streamsize precision = out.precision();
    const std::size_t shown = std::min(n_gaus, static_cast<std::size_t>(ngaus));
    for (std::size_t i = 0; i < shown; ++i) {
        const Gaussian& g = (*res.gaussians)[i];
        out << "  " << std::setw(6) << g.gaus_num << std::setw(6) << g.island_id
             << std::setw(10) << std::fixed << std::setprecision(2) << g.x
             << std::setw(10) << g.y
             << std::setw(14) << std::scientific << std::setprecision(4) << g.peak_flux
             << std::setw(14) << g.total_flux << std::defaultfloat << "\n";
    }
    out.precision(precision);
    if (shown < n_gaus) {
        out << "  ... " << (n_gaus - shown) << " more\n";
    }
    out.flush();
}

} // namespace bdsm::interface
