#pragma once

#include "bdsm/config/options.hpp"
#include "bdsm/pipeline/pipeline.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <yaml-cpp/yaml.h>

namespace bdsm::image {
class Image;
}

// User-facing operations on an Image. Errors are thrown; the Image methods
// of the same name decide how they reach the user.
namespace bdsm::interface {

namespace fs = std::filesystem;

constexpr const char* kSaveFileFormat = "bdsm-pars";
constexpr int kSaveFileVersion = 1;

void list_pars(const image::Image& img, std::ostream& out);

// Applies and validates overrides; the options are unchanged on error.
void set_pars(image::Image& img, const YAML::Node& overrides);

pipeline::ProcessReport process(image::Image& img, const YAML::Node& overrides);

// "<filename>.pybdsm.sav"
fs::path default_save_path(const config::Options& opts);

fs::path save_pars(const image::Image& img, const std::string& savefile);

/**
 * Replaces the options with the ones stored in `loadfile` (default save
 * path when empty). The current filename is kept.
 *
 * Throws NotFoundError when the file does not exist and InvalidFormatError
 * when it cannot be parsed as a parameter save file.
 */
void load_pars(image::Image& img, const std::string& loadfile);

// "<stem><suffix>" in opts.outdir, or next to the input image.
fs::path default_output_path(const config::Options& opts, const std::string& suffix);

fs::path export_image(const image::Image& img, const YAML::Node& overrides);

fs::path write_catalog(const image::Image& img, const YAML::Node& overrides);

} // namespace bdsm::interface
