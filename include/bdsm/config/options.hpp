#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace bdsm::config {

namespace fs = std::filesystem;

// Description of one user option, used for listing and key validation.
struct OptionInfo {
  std::string name;
  std::string group;
  std::string doc;
};

struct Options {
  // input / output
  std::string filename;
  std::string outdir;          // empty = next to the input image
  bool quiet = false;
  bool debug = false;

  // map cache
  bool do_cache = false;
  std::string cache_backend = "disk"; // disk | memory
  std::string cache_dir;              // empty = per-image temp directory
  int cache_bitpix = -32;             // -32 | -64

  // reading and collapsing
  std::string collapse_mode = "average"; // average | single
  int collapse_ch0 = 0;
  bool polarisation_do = false;
  std::optional<double> frequency;       // Hz
  std::optional<std::array<double, 3>> beam; // bmaj, bmin, bpa (deg)
  std::optional<double> blank_limit;     // Jy/beam

  // statistics and thresholds
  double kappa_clip = 3.0;
  double thresh_pix = 5.0;
  double thresh_isl = 3.0;
  std::optional<int> minpix_isl;

  // background maps
  std::string mean_map = "default";      // default | zero | const | map
  std::optional<bool> rms_map;           // unset = decide from rms_box
  std::optional<std::array<int, 2>> rms_box; // box size, step (pix)

  static Options load(const fs::path &path);
  static Options from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Applies a map of option name -> value. Unknown names or values of the
  // wrong type throw ConfigError and leave *this unchanged.
  void apply(const YAML::Node &overrides);
};

const std::vector<OptionInfo> &option_infos();
bool is_known_option(const std::string &name);

// Names of options whose values differ between a and b.
std::vector<std::string> diff_options(const Options &a, const Options &b);

// Prints all options grouped by section; non-default values are flagged.
void list_options(const Options &opts, std::ostream &out);

std::string get_schema_json();

} // namespace bdsm::config
