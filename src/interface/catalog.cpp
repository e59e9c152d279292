#include "bdsm/interface/interface.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace bdsm::interface {

using json = nlohmann::json;

namespace {

struct CatalogOptions {
    std::string outfile;
    std::string format = "ascii";      // ascii | csv | json
    std::string catalog_type = "srl";  // gaul | srl
    bool clobber = false;
};

CatalogOptions parse_catalog_options(const YAML::Node& overrides) {
    CatalogOptions co;
    if (!overrides || overrides.IsNull()) {
        return co;
    }
    if (!overrides.IsMap()) {
        throw ConfigError("catalog options must be a mapping");
    }
    for (const auto& kv : overrides) {
        const std::string key = kv.first.as<std::string>();
        try {
            if (key == "outfile") {
                co.outfile = kv.second.as<std::string>();
            } else if (key == "format") {
                co.format = core::to_lower(kv.second.as<std::string>());
            } else if (key == "catalog_type") {
                co.catalog_type = core::to_lower(kv.second.as<std::string>());
            } else if (key == "clobber") {
                co.clobber = kv.second.as<bool>();
            } else {
                throw ConfigError("unknown catalog option '" + key + "'");
            }
        } catch (const YAML::Exception&) {
            throw ConfigError("invalid value for catalog option '" + key + "'");
        }
    }
    return co;
}

struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<json>> rows;
};

Table gaussian_table(const std::vector<Gaussian>& gaussians) {
    Table t;
    t.columns = {"Gaus_id", "Isl_id", "Source_id", "RA", "DEC", "Xposn", "Yposn",
                 "Total_flux", "E_Total_flux", "Peak_flux", "E_Peak_flux",
                 "Maj", "Min", "PA", "Isl_rms", "Isl_mean"};
    for (const auto& g : gaussians) {
        t.rows.push_back({g.gaus_num, g.island_id, g.source_id, g.ra, g.dec, g.x, g.y,
                          g.total_flux, g.total_flux_err, g.peak_flux, g.peak_flux_err,
                          g.maj, g.min, g.pa, g.rms, g.mean});
    }
    return t;
}

Table source_table(const std::vector<Source>& sources) {
    Table t;
    t.columns = {"Source_id", "Isl_id", "RA", "DEC", "Xposn", "Yposn",
                 "Total_flux", "E_Total_flux", "Peak_flux", "E_Peak_flux",
                 "Maj", "Min", "PA", "Isl_rms", "N_gaus", "S_Code"};
    for (const auto& s : sources) {
        t.rows.push_back({s.source_id, s.island_id, s.ra, s.dec, s.x, s.y,
                          s.total_flux, s.total_flux_err, s.peak_flux, s.peak_flux_err,
                          s.maj, s.min, s.pa, s.rms, s.ngaus, s.code});
    }
    return t;
}

std::string format_cell(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    std::ostringstream oss;
    oss << std::setprecision(10) << v.get<double>();
    return oss.str();
}

std::vector<std::string> header_lines(const image::Image& img, const std::string& title) {
    std::vector<std::string> lines;
    lines.push_back(title);
    lines.push_back("Generated by bdsm on " + core::get_iso_timestamp());
    lines.push_back("Image file : " + img.opts().filename);
    if (img.results().frequency) {
        std::ostringstream oss;
        oss << "Reference frequency : " << std::setprecision(10) << *img.results().frequency << " Hz";
        lines.push_back(oss.str());
    }
    for (const auto& [key, value] : img.extraparams()) {
        lines.push_back(key + " = " + value);
    }
    return lines;
}

std::string render_delimited(const Table& t, const std::vector<std::string>& header,
                             const std::string& delim) {
    std::ostringstream out;
    for (const auto& line : header) {
        out << "# " << line << "\n";
    }
    out << "#\n";
    out << "# " << core::join(t.columns, delim) << "\n";
    for (const auto& row : t.rows) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& v : row) {
            cells.push_back(format_cell(v));
        }
        out << core::join(cells, delim) << "\n";
    }
    return out.str();
}

std::string render_json(const Table& t, const image::Image& img, const std::string& catalog_type) {
    json doc;
    doc["catalog_type"] = catalog_type;
    doc["image"] = img.opts().filename;
    doc["generated"] = core::get_iso_timestamp();
    if (img.results().frequency) {
        doc["frequency"] = *img.results().frequency;
    }
    doc["extraparams"] = json::object();
    for (const auto& [key, value] : img.extraparams()) {
        doc["extraparams"][key] = value;
    }
    doc["columns"] = t.columns;
    doc["rows"] = json::array();
    for (const auto& row : t.rows) {
        json obj = json::object();
        for (std::size_t i = 0; i < t.columns.size(); ++i) {
            obj[t.columns[i]] = row[i];
        }
        doc["rows"].push_back(obj);
    }
    return doc.dump(2) + "\n";
}

} // namespace

fs::path write_catalog(const image::Image& img, const YAML::Node& overrides) {
    const CatalogOptions co = parse_catalog_options(overrides);

    if (co.format != "ascii" && co.format != "csv" && co.format != "json") {
        throw ValidationError("format must be one of 'ascii', 'csv' or 'json'");
    }
    if (co.catalog_type != "gaul" && co.catalog_type != "srl") {
        throw ValidationError("catalog_type must be 'gaul' or 'srl'");
    }

    const auto& res = img.results();
    Table table;
    std::string title;
    if (co.catalog_type == "gaul") {
        if (!res.gaussians || res.gaussians->empty()) {
            throw NotFoundError("No Gaussians were fit to image. Output file not written.");
        }
        table = gaussian_table(*res.gaussians);
        title = "Gaussian list";
    } else {
        if (!res.sources || res.sources->empty()) {
            throw NotFoundError("No sources were found in the image. Output file not written.");
        }
        table = source_table(*res.sources);
        title = "Source list";
    }

    std::string suffix = ".pybdsm." + co.catalog_type;
    if (co.format != "ascii") {
        suffix += "." + co.format;
    }
    const fs::path out = co.outfile.empty() ? default_output_path(img.opts(), suffix)
                                            : fs::path(co.outfile);
    if (fs::exists(out) && !co.clobber) {
        throw IOError("'" + out.string() + "' exists and clobber is not set");
    }

    if (out.has_parent_path()) {
        fs::create_directories(out.parent_path());
    }

    std::string text;
    if (co.format == "json") {
        text = render_json(table, img, co.catalog_type);
    } else {
        const auto header = header_lines(img, title);
        text = render_delimited(table, header, co.format == "csv" ? "," : " ");
    }
    core::write_text(out, text);

    if (!img.opts().quiet) {
        std::cerr << "[CATALOG] Wrote " << table.rows.size() << " row(s) to " << out.string() << std::endl;
    }
    return out;
}

} // namespace bdsm::interface
