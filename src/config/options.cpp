#include "bdsm/config/options.hpp"
#include "bdsm/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace bdsm::config {

static ConfigError bad_value(const std::string& key) {
    return ConfigError("invalid value for option '" + key + "'");
}

template <typename T>
static void read_value(const YAML::Node& node, const std::string& key, T& out) {
    const YAML::Node n = node[key];
    if (!n) return;
    try {
        out = n.as<T>();
    } catch (const YAML::Exception&) {
        throw bad_value(key);
    }
}

template <typename T>
static void read_optional(const YAML::Node& node, const std::string& key, std::optional<T>& out) {
    const YAML::Node n = node[key];
    if (!n) return;
    if (n.IsNull()) {
        out.reset();
        return;
    }
    try {
        out = n.as<T>();
    } catch (const YAML::Exception&) {
        throw bad_value(key);
    }
}

static void read_double_triple(const YAML::Node& node, const std::string& key,
                               std::optional<std::array<double, 3>>& out) {
    const YAML::Node n = node[key];
    if (!n) return;
    if (n.IsNull()) {
        out.reset();
        return;
    }
    if (!n.IsSequence() || n.size() != 3) {
        throw bad_value(key);
    }
    try {
        out = std::array<double, 3>{n[0].as<double>(), n[1].as<double>(), n[2].as<double>()};
    } catch (const YAML::Exception&) {
        throw bad_value(key);
    }
}

static void read_int_pair(const YAML::Node& node, const std::string& key,
                          std::optional<std::array<int, 2>>& out) {
    const YAML::Node n = node[key];
    if (!n) return;
    if (n.IsNull()) {
        out.reset();
        return;
    }
    if (!n.IsSequence() || n.size() != 2) {
        throw bad_value(key);
    }
    try {
        out = std::array<int, 2>{n[0].as<int>(), n[1].as<int>()};
    } catch (const YAML::Exception&) {
        throw bad_value(key);
    }
}

template <typename T>
static YAML::Node optional_node(const std::optional<T>& v) {
    YAML::Node n;
    if (v) {
        n = *v;
    } else {
        n = YAML::Null;
    }
    return n;
}

const std::vector<OptionInfo>& option_infos() {
    static const std::vector<OptionInfo> infos = {
        {"filename", "input", "Input image file name"},
        {"outdir", "input", "Directory for output files (empty: next to the input image)"},
        {"quiet", "input", "Suppress diagnostic output"},
        {"debug", "input", "Print extra diagnostic output"},
        {"do_cache", "cache", "Cache internal maps to disk"},
        {"cache_backend", "cache", "Map store used when caching: 'disk' or 'memory'"},
        {"cache_dir", "cache", "Directory for cached maps (empty: temporary directory)"},
        {"cache_bitpix", "cache", "Pixel type of cached maps: -32 (float) or -64 (double)"},
        {"collapse_mode", "collapse", "Channel collapse: 'average' or 'single'"},
        {"collapse_ch0", "collapse", "Channel used when collapse_mode is 'single'"},
        {"polarisation_do", "collapse", "Read and collapse Stokes Q, U and V"},
        {"frequency", "collapse", "Observing frequency in Hz (null: from header)"},
        {"beam", "collapse", "Restoring beam [bmaj, bmin, bpa] in deg (null: from header)"},
        {"blank_limit", "collapse", "Pixels with |value| below this are blanked (null: none)"},
        {"kappa_clip", "statistics", "Kappa for iterative sigma clipping"},
        {"thresh_pix", "statistics", "Source detection threshold in sigma"},
        {"thresh_isl", "statistics", "Island boundary threshold in sigma"},
        {"minpix_isl", "statistics", "Minimum island size in pixels (null: from beam)"},
        {"mean_map", "background", "Background mean: 'default', 'zero', 'const' or 'map'"},
        {"rms_map", "background", "Background rms map (true), constant (false) or null for automatic"},
        {"rms_box", "background", "Box size and step [box, step] in pixels for rms/mean maps"},
    };
    return infos;
}

bool is_known_option(const std::string& name) {
    const auto& infos = option_infos();
    return std::any_of(infos.begin(), infos.end(),
                       [&](const OptionInfo& i) { return i.name == name; });
}

Options Options::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Options file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse options file " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Options Options::from_yaml(const YAML::Node& node) {
    Options opts;
    if (!node || node.IsNull()) {
        return opts;
    }
    if (!node.IsMap()) {
        throw ConfigError("options must be a mapping of option names to values");
    }

    read_value(node, "filename", opts.filename);
    read_value(node, "outdir", opts.outdir);
    read_value(node, "quiet", opts.quiet);
    read_value(node, "debug", opts.debug);

    read_value(node, "do_cache", opts.do_cache);
    read_value(node, "cache_backend", opts.cache_backend);
    read_value(node, "cache_dir", opts.cache_dir);
    read_value(node, "cache_bitpix", opts.cache_bitpix);

    read_value(node, "collapse_mode", opts.collapse_mode);
    read_value(node, "collapse_ch0", opts.collapse_ch0);
    read_value(node, "polarisation_do", opts.polarisation_do);
    read_optional(node, "frequency", opts.frequency);
    read_double_triple(node, "beam", opts.beam);
    read_optional(node, "blank_limit", opts.blank_limit);

    read_value(node, "kappa_clip", opts.kappa_clip);
    read_value(node, "thresh_pix", opts.thresh_pix);
    read_value(node, "thresh_isl", opts.thresh_isl);
    read_optional(node, "minpix_isl", opts.minpix_isl);

    read_value(node, "mean_map", opts.mean_map);
    read_optional(node, "rms_map", opts.rms_map);
    read_int_pair(node, "rms_box", opts.rms_box);

    return opts;
}

void Options::save(const fs::path& path) const {
    std::ofstream ofs(path);
    if (!ofs) {
        throw IOError("Cannot create options file: " + path.string());
    }
    YAML::Emitter out;
    out << to_yaml();
    ofs << out.c_str() << "\n";
}

YAML::Node Options::to_yaml() const {
    YAML::Node node;

    node["filename"] = filename;
    node["outdir"] = outdir;
    node["quiet"] = quiet;
    node["debug"] = debug;

    node["do_cache"] = do_cache;
    node["cache_backend"] = cache_backend;
    node["cache_dir"] = cache_dir;
    node["cache_bitpix"] = cache_bitpix;

    node["collapse_mode"] = collapse_mode;
    node["collapse_ch0"] = collapse_ch0;
    node["polarisation_do"] = polarisation_do;
    node["frequency"] = optional_node(frequency);
    if (beam) {
        YAML::Node b;
        b.push_back((*beam)[0]);
        b.push_back((*beam)[1]);
        b.push_back((*beam)[2]);
        b.SetStyle(YAML::EmitterStyle::Flow);
        node["beam"] = b;
    } else {
        node["beam"] = YAML::Null;
    }
    node["blank_limit"] = optional_node(blank_limit);

    node["kappa_clip"] = kappa_clip;
    node["thresh_pix"] = thresh_pix;
    node["thresh_isl"] = thresh_isl;
    node["minpix_isl"] = optional_node(minpix_isl);

    node["mean_map"] = mean_map;
    node["rms_map"] = optional_node(rms_map);
    if (rms_box) {
        YAML::Node b;
        b.push_back((*rms_box)[0]);
        b.push_back((*rms_box)[1]);
        b.SetStyle(YAML::EmitterStyle::Flow);
        node["rms_box"] = b;
    } else {
        node["rms_box"] = YAML::Null;
    }

    return node;
}

void Options::validate() const {
    if (cache_backend != "disk" && cache_backend != "memory") {
        throw ValidationError("cache_backend must be 'disk' or 'memory'");
    }
    if (cache_bitpix != -32 && cache_bitpix != -64) {
        throw ValidationError("cache_bitpix must be -32 or -64");
    }

    if (collapse_mode != "average" && collapse_mode != "single") {
        throw ValidationError("collapse_mode must be 'average' or 'single'");
    }
    if (collapse_ch0 < 0) {
        throw ValidationError("collapse_ch0 must be >= 0");
    }
    if (frequency && *frequency <= 0.0) {
        throw ValidationError("frequency must be > 0");
    }
    if (beam) {
        if ((*beam)[0] <= 0.0 || (*beam)[1] <= 0.0) {
            throw ValidationError("beam major and minor axes must be > 0");
        }
        if ((*beam)[1] > (*beam)[0]) {
            throw ValidationError("beam minor axis must be <= major axis");
        }
    }
    if (blank_limit && *blank_limit < 0.0) {
        throw ValidationError("blank_limit must be >= 0");
    }

    if (kappa_clip <= 0.0) {
        throw ValidationError("kappa_clip must be > 0");
    }
    if (thresh_pix <= 0.0) {
        throw ValidationError("thresh_pix must be > 0");
    }
    if (thresh_isl <= 0.0) {
        throw ValidationError("thresh_isl must be > 0");
    }
    if (thresh_isl > thresh_pix) {
        throw ValidationError("thresh_isl must be <= thresh_pix");
    }
    if (minpix_isl && *minpix_isl < 1) {
        throw ValidationError("minpix_isl must be >= 1");
    }

    if (mean_map != "default" && mean_map != "zero" && mean_map != "const" && mean_map != "map") {
        throw ValidationError("mean_map must be 'default', 'zero', 'const' or 'map'");
    }
    if (rms_box) {
        if ((*rms_box)[0] < 2) {
            throw ValidationError("rms_box size must be >= 2");
        }
        if ((*rms_box)[1] < 1 || (*rms_box)[1] > (*rms_box)[0]) {
            throw ValidationError("rms_box step must be in [1, box size]");
        }
    }
}

void Options::apply(const YAML::Node& overrides) {
    if (!overrides || overrides.IsNull()) {
        return;
    }
    if (!overrides.IsMap()) {
        throw ConfigError("parameter overrides must be a mapping of option names to values");
    }

    YAML::Node merged = to_yaml();
    for (const auto& kv : overrides) {
        const std::string key = kv.first.as<std::string>();
        if (!is_known_option(key)) {
            throw ConfigError("unknown option '" + key + "'");
        }
        merged[key] = kv.second;
    }
    *this = from_yaml(merged);
}

std::vector<std::string> diff_options(const Options& a, const Options& b) {
    const YAML::Node na = a.to_yaml();
    const YAML::Node nb = b.to_yaml();

    std::vector<std::string> changed;
    for (const auto& info : option_infos()) {
        if (YAML::Dump(na[info.name]) != YAML::Dump(nb[info.name])) {
            changed.push_back(info.name);
        }
    }
    return changed;
}

void list_options(const Options& opts, std::ostream& out) {
    const YAML::Node current = opts.to_yaml();
    const auto changed = diff_options(Options{}, opts);

    std::string group;
    for (const auto& info : option_infos()) {
        if (info.group != group) {
            group = info.group;
            out << "\n" << group << ":\n";
        }
        const bool is_changed =
            std::find(changed.begin(), changed.end(), info.name) != changed.end();
        YAML::Emitter val;
        val << YAML::Flow << current[info.name];
        out << "  " << (is_changed ? "* " : "  ")
            << std::left << std::setw(18) << info.name << " = "
            << std::setw(14) << val.c_str() << " : " << info.doc << "\n";
    }
    out << "\n(* = non-default value)\n";
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "additionalProperties": false,
  "properties": {
    "filename": {"type": "string"},
    "outdir": {"type": "string"},
    "quiet": {"type": "boolean"},
    "debug": {"type": "boolean"},
    "do_cache": {"type": "boolean"},
    "cache_backend": {"type": "string", "enum": ["disk", "memory"]},
    "cache_dir": {"type": "string"},
    "cache_bitpix": {"type": "integer", "enum": [-32, -64]},
    "collapse_mode": {"type": "string", "enum": ["average", "single"]},
    "collapse_ch0": {"type": "integer", "minimum": 0},
    "polarisation_do": {"type": "boolean"},
    "frequency": {"type": ["number", "null"], "exclusiveMinimum": 0},
    "beam": {"type": ["array", "null"], "items": {"type": "number"}, "minItems": 3, "maxItems": 3},
    "blank_limit": {"type": ["number", "null"], "minimum": 0},
    "kappa_clip": {"type": "number", "exclusiveMinimum": 0},
    "thresh_pix": {"type": "number", "exclusiveMinimum": 0},
    "thresh_isl": {"type": "number", "exclusiveMinimum": 0},
    "minpix_isl": {"type": ["integer", "null"], "minimum": 1},
    "mean_map": {"type": "string", "enum": ["default", "zero", "const", "map"]},
    "rms_map": {"type": ["boolean", "null"]},
    "rms_box": {"type": ["array", "null"], "items": {"type": "integer"}, "minItems": 2, "maxItems": 2}
  }
})";
}

} // namespace bdsm::config
