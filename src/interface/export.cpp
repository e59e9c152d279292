#include "bdsm/interface/interface.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/io/fits_io.hpp"

#include <iostream>
#include <limits>

namespace bdsm::interface {

namespace {

struct ExportOptions {
    std::string outfile;
    std::string img_type = "ch0";
    std::string img_format = "fits";
    bool clobber = false;
    int bitpix = -32;
};

template <typename T>
T option_value(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("invalid value for export option '" + key + "'");
    }
}

ExportOptions parse_export_options(const YAML::Node& overrides) {
    ExportOptions eo;
    if (!overrides || overrides.IsNull()) {
        return eo;
    }
    if (!overrides.IsMap()) {
        throw ConfigError("export options must be a mapping");
    }
    for (const auto& kv : overrides) {
        const std::string key = kv.first.as<std::string>();
        if (key == "outfile") {
            eo.outfile = option_value<std::string>(kv.second, key);
        } else if (key == "img_type") {
            eo.img_type = option_value<std::string>(kv.second, key);
        } else if (key == "img_format") {
            eo.img_format = option_value<std::string>(kv.second, key);
        } else if (key == "clobber") {
            eo.clobber = option_value<bool>(kv.second, key);
        } else if (key == "bitpix") {
            eo.bitpix = option_value<int>(kv.second, key);
        } else {
            throw ConfigError("unknown export option '" + key + "'");
        }
    }
    return eo;
}

MapId resolve_img_type(const std::string& img_type) {
    if (img_type == "gaus_resid") return MapId::RESID_GAUS;
    if (img_type == "gaus_model") return MapId::MODEL_GAUS;
    auto id = string_to_map_id(img_type);
    if (!id) {
        throw ValidationError("Image type '" + img_type + "' not recognized.");
    }
    return *id;
}

} // namespace

fs::path export_image(const image::Image& img, const YAML::Node& overrides) {
    const ExportOptions eo = parse_export_options(overrides);

    const MapId id = resolve_img_type(eo.img_type);
    if (eo.img_format != "fits") {
        throw ValidationError("img_format must be 'fits'");
    }
    if (eo.bitpix != -32 && eo.bitpix != -64) {
        throw ValidationError("bitpix must be -32 or -64");
    }
    if (!img.has_map(id)) {
        throw NotFoundError("Image type '" + eo.img_type + "' not available. Please run process first.");
    }

    const fs::path out = eo.outfile.empty()
        ? default_output_path(img.opts(), ".pybdsm_" + eo.img_type + ".fits")
        : fs::path(eo.outfile);
    if (fs::exists(out) && !eo.clobber) {
        throw IOError("'" + out.string() + "' exists and clobber is not set");
    }
    if (out.has_parent_path()) {
        fs::create_directories(out.parent_path());
    }

    Matrix2Dd data = img.get_map(id);
    const MaskArray* mask = img.mask();
    if (mask && mask->rows() == data.rows() && mask->cols() == data.cols()) {
        for (Eigen::Index i = 0; i < data.size(); ++i) {
            if (mask->data()[i]) {
                data.data()[i] = std::numeric_limits<double>::quiet_NaN();
            }
        }
    }

    io::write_fits_image(out, data, img.header(), eo.bitpix);

    if (!img.opts().quiet) {
        std::cerr << "[EXPORT] Wrote " << map_id_to_string(id) << " to " << out.string() << std::endl;
    }
    return out;
}

} // namespace bdsm::interface
