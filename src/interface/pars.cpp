#include "bdsm/interface/interface.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"

#include <iostream>

namespace bdsm::interface {

namespace {

bool cache_settings_changed(const config::Options& a, const config::Options& b) {
    return a.cache_backend != b.cache_backend || a.cache_dir != b.cache_dir ||
           a.cache_bitpix != b.cache_bitpix;
}

// Installs `updated` as the image options and brings the map cache in line
// with it. Restores the previous options if the cache cannot follow.
void assign_options(image::Image& img, const config::Options& updated) {
    const config::Options previous = img.opts();
    img.opts() = updated;
    try {
        if (updated.do_cache != img.do_cache()) {
            img.set_do_cache(updated.do_cache);
        } else if (updated.do_cache && cache_settings_changed(previous, updated)) {
            img.set_do_cache(false);
            img.set_do_cache(true);
        }
    } catch (const std::runtime_error&) {
        img.opts() = previous;
        if (previous.do_cache && !img.do_cache()) {
            img.set_do_cache(true);
        }
        throw;
    }
}

} // namespace

void list_pars(const image::Image& img, std::ostream& out) {
    config::list_options(img.opts(), out);
}

void set_pars(image::Image& img, const YAML::Node& overrides) {
    config::Options updated = img.opts();
    updated.apply(overrides);
    updated.validate();
    assign_options(img, updated);
}

fs::path default_save_path(const config::Options& opts) {
    if (opts.filename.empty()) {
        throw ConfigError("filename is not set; give the name of the save file");
    }
    return fs::path(opts.filename + ".pybdsm.sav");
}

fs::path save_pars(const image::Image& img, const std::string& savefile) {
    const fs::path path = savefile.empty() ? default_save_path(img.opts()) : fs::path(savefile);

    YAML::Node root;
    root["format"] = kSaveFileFormat;
    root["version"] = kSaveFileVersion;
    root["saved"] = core::get_iso_timestamp();
    root["opts"] = img.opts().to_yaml();

    YAML::Emitter out;
    out << root;
    core::write_text(path, std::string(out.c_str()) + "\n");

    if (!img.opts().quiet) {
        std::cerr << "[PARS] Saved parameters to " << path.string() << std::endl;
    }
    return path;
}

void load_pars(image::Image& img, const std::string& loadfile) {
    const fs::path path = loadfile.empty() ? default_save_path(img.opts()) : fs::path(loadfile);
    if (!fs::exists(path)) {
        throw NotFoundError("File '" + path.string() + "' not found.");
    }

    const std::string invalid = "'" + path.string() + "' is not a valid parameter save file.";
    config::Options loaded;
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap() || root["format"].as<std::string>("") != kSaveFileFormat ||
            !root["opts"] || !root["opts"].IsMap()) {
            throw InvalidFormatError(invalid);
        }
        loaded = config::Options::from_yaml(root["opts"]);
        loaded.validate();
    } catch (const YAML::Exception&) {
        throw InvalidFormatError(invalid);
    } catch (const ConfigError&) {
        throw InvalidFormatError(invalid);
    } catch (const ValidationError&) {
        throw InvalidFormatError(invalid);
    }

    loaded.filename = img.opts().filename;
    assign_options(img, loaded);

    if (!img.opts().quiet) {
        std::cerr << "[PARS] Loaded parameters from " << path.string() << std::endl;
    }
}

} // namespace bdsm::interface
