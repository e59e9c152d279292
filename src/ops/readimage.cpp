#include "bdsm/ops/builtin_ops.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/io/fits_io.hpp"

#include <iostream>

namespace bdsm::ops {

using image::ResultField;

std::vector<std::string> OpReadImage::depends_on() const {
    return {"filename", "collapse_mode", "collapse_ch0", "polarisation_do", "frequency", "beam"};
}

pipeline::OpOutputs OpReadImage::provides() const {
    return {
        {MapId::IMAGE, MapId::CH0_Q, MapId::CH0_U, MapId::CH0_V},
        {ResultField::BEAM, ResultField::FREQUENCY, ResultField::NCHAN}
    };
}

static Matrix2Dd collapse_channels(const io::FitsCube& cube, int stokes, const config::Options& opts) {
    if (opts.collapse_mode == "single") {
        if (opts.collapse_ch0 >= cube.nchan) {
            throw ValidationError("collapse_ch0 = " + std::to_string(opts.collapse_ch0) +
                                  " but the image has " + std::to_string(cube.nchan) + " channel(s)");
        }
        return cube.plane(stokes, opts.collapse_ch0);
    }

    // Blank pixels in any channel stay blank in the average.
    Matrix2Dd sum = Matrix2Dd::Zero(cube.height, cube.width);
    for (int c = 0; c < cube.nchan; ++c) {
        sum += cube.plane(stokes, c);
    }
    return sum / static_cast<double>(cube.nchan);
}

static std::optional<double> frequency_from_header(const io::FitsHeader& header) {
    for (const char* axis : {"3", "4"}) {
        const std::string ctype = core::to_upper(header.get_string(std::string("CTYPE") + axis).value_or(""));
        if (core::starts_with(ctype, "FREQ")) {
            if (auto v = header.get_number(std::string("CRVAL") + axis)) return v;
        }
    }
    if (auto v = header.get_number("RESTFRQ")) return v;
    if (auto v = header.get_number("RESTFREQ")) return v;
    return std::nullopt;
}

static std::optional<Beam> beam_from_header(const io::FitsHeader& header) {
    auto bmaj = header.get_number("BMAJ");
    auto bmin = header.get_number("BMIN");
    if (!bmaj || !bmin) return std::nullopt;
    Beam beam;
    beam.bmaj = *bmaj;
    beam.bmin = *bmin;
    beam.bpa = header.get_number("BPA").value_or(0.0);
    return beam;
}

void OpReadImage::run(image::Image& img) {
    const config::Options& opts = img.opts();
    if (opts.filename.empty()) {
        throw ConfigError("filename is not set");
    }
    if (!fs::exists(opts.filename)) {
        throw NotFoundError("File '" + opts.filename + "' not found.");
    }

    io::FitsCube cube = io::read_fits_cube(opts.filename);
    img.header() = cube.header;
    img.results().nchan = cube.nchan;

    img.put_map(MapId::IMAGE, collapse_channels(cube, 0, opts));

    if (opts.polarisation_do) {
        if (cube.nstokes < 4) {
            if (!opts.quiet) {
                std::cerr << "[READ] polarisation_do is set but the image has " << cube.nstokes
                          << " Stokes plane(s); Q, U and V are not available" << std::endl;
            }
        } else {
            img.put_map(MapId::CH0_Q, collapse_channels(cube, 1, opts));
            img.put_map(MapId::CH0_U, collapse_channels(cube, 2, opts));
            img.put_map(MapId::CH0_V, collapse_channels(cube, 3, opts));
        }
    }

    if (opts.frequency) {
        img.results().frequency = *opts.frequency;
    } else if (auto f = frequency_from_header(cube.header)) {
        img.results().frequency = *f;
    } else if (!opts.quiet) {
        std::cerr << "[READ] Frequency not found in header; set the frequency option" << std::endl;
    }

    if (opts.beam) {
        Beam beam;
        beam.bmaj = (*opts.beam)[0];
        beam.bmin = (*opts.beam)[1];
        beam.bpa = (*opts.beam)[2];
        img.results().beam = beam;
    } else if (auto b = beam_from_header(cube.header)) {
        img.results().beam = *b;
    } else if (!opts.quiet) {
        std::cerr << "[READ] Beam not found in header; set the beam option" << std::endl;
    }

    if (!opts.quiet) {
        std::cerr << "[READ] " << opts.filename << ": " << cube.width << "x" << cube.height
                  << ", " << cube.nchan << " channel(s), " << cube.nstokes << " Stokes plane(s)"
                  << std::endl;
    }
}

} // namespace bdsm::ops
