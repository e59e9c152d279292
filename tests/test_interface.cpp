#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/interface/interface.hpp"
#include "bdsm/io/fits_io.hpp"
#include "bdsm/pipeline/pipeline.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace bdsm;
using image::Image;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

// field.fits in `dir`: 12x10 noise with one blank pixel at x=3, y=2.
fs::path write_field(const testing::TempDir& dir) {
    testing::CubeSpec spec;
    spec.width = 12;
    spec.height = 10;
    spec.numeric_keys = {{"BMAJ", 0.002}, {"BMIN", 0.002}};
    spec.string_keys = {{"OBJECT", "FIELD"}};
    const fs::path p = dir.file("field.fits");
    testing::write_test_cube(p, spec, [](int x, int y, int, int) {
        if (x == 3 && y == 2) return std::numeric_limits<double>::quiet_NaN();
        return 1.0 + testing::pseudo_noise(x, y, 0.5);
    });
    return p;
}

struct Processed {
    testing::TempDir dir{"iface"};
    fs::path input = write_field(dir);
    std::shared_ptr<testing::FakeSourceFinder> finder = std::make_shared<testing::FakeSourceFinder>();
    std::unique_ptr<Image> img;

    Processed() {
        config::Options opts = testing::quiet_options();
        opts.filename = input.string();
        img = std::make_unique<Image>(opts);
        auto chain = pipeline::Pipeline::default_chain();
        chain->add_op(finder);
        img->set_pipeline(chain);
        if (!img->process()) {
            throw std::runtime_error("processing the test image failed");
        }
    }
};

} // namespace

TEST_CASE("default_output_path_strips_fits_extension") {
    config::Options opts;
    opts.filename = "/data/obs/field.FITS";
    REQUIRE(interface::default_output_path(opts, ".pybdsm.srl") == fs::path("/data/obs/field.pybdsm.srl"));

    opts.outdir = "/results";
    REQUIRE(interface::default_output_path(opts, ".pybdsm.srl") == fs::path("/results/field.pybdsm.srl"));

    opts.filename = "img.dat";
    opts.outdir.clear();
    REQUIRE(interface::default_output_path(opts, ".x") == fs::path("img.dat.x"));

    opts.filename.clear();
    REQUIRE_THROWS_AS(interface::default_output_path(opts, ".x"), ConfigError);
}

TEST_CASE("process_report_lists_run_and_skipped_ops") {
    Processed p;
    REQUIRE(p.finder->runs == 1);
    REQUIRE(p.img->results().nisl == 1);

    auto report = interface::process(*p.img, YAML::Load("{thresh_isl: 2.5}"));
    REQUIRE(report.ops_run == std::vector<std::string>{"preprocess", "rmsmap", "fake_finder"});
    REQUIRE(report.ops_skipped == std::vector<std::string>{"readimage", "collapse"});
    REQUIRE_FALSE(report.run_id.empty());
    REQUIRE(p.finder->runs == 2);
}

TEST_CASE("export_image_writes_masked_pixels_as_nan") {
    Processed p;
    auto written = p.img->export_image();
    REQUIRE(written.has_value());
    REQUIRE(*written == p.dir.file("field.pybdsm_ch0.fits"));

    const Matrix2Dd back = io::read_fits_image(*written);
    REQUIRE(back.rows() == 10);
    REQUIRE(back.cols() == 12);
    REQUIRE(std::isnan(back(2, 3)));
    REQUIRE(back(5, 5) == Catch::Approx(1.0 + testing::pseudo_noise(5, 5, 0.5)).epsilon(1e-6));

    io::FitsCube cube = io::read_fits_cube(*written);
    REQUIRE(cube.header.get_string("OBJECT") == std::string("FIELD"));
    REQUIRE(cube.header.get_number("BMAJ").value() == Catch::Approx(0.002));
}

TEST_CASE("export_image_honours_clobber") {
    Processed p;
    REQUIRE(p.img->export_image(YAML::Load("{img_type: rms}")));
    REQUIRE_THROWS_AS(p.img->export_image(YAML::Load("{img_type: rms}")), std::runtime_error);
    REQUIRE(p.img->export_image(YAML::Load("{img_type: rms, clobber: true}")));
}

TEST_CASE("export_image_residual_with_explicit_outfile") {
    Processed p;
    const fs::path out = p.dir.path() / "products" / "resid.fits";

    YAML::Node opts;
    opts["img_type"] = "gaus_resid";
    opts["outfile"] = out.string();
    opts["bitpix"] = -64;
    auto written = p.img->export_image(opts);
    REQUIRE(written.has_value());
    REQUIRE(*written == out);

    const Matrix2Dd back = io::read_fits_image(out);
    REQUIRE(back(4, 7) == p.img->get_map(MapId::CH0)(4, 7));
    REQUIRE(std::isnan(back(2, 3)));
}

TEST_CASE("write_catalog_ascii_source_list") {
    Processed p;
    p.img->extraparams()["bbsName"] = "field";

    auto written = p.img->write_catalog();
    REQUIRE(written.has_value());
    REQUIRE(*written == p.dir.file("field.pybdsm.srl"));

    const auto lines = lines_of(core::read_text(*written));
    REQUIRE(lines.size() == 8);
    REQUIRE(lines[0] == "# Source list");
    REQUIRE(core::starts_with(lines[1], "# Generated by bdsm on "));
    REQUIRE(lines[2] == "# Image file : " + p.input.string());
    REQUIRE(lines[3] == "# bbsName = field");
    REQUIRE(lines[4] == "#");
    REQUIRE(core::starts_with(lines[5], "# Source_id Isl_id RA DEC Xposn Yposn Total_flux"));
    REQUIRE(lines[6] == "0 0 150 2 10 12 2.5 0 1.5 0 0 0 0 0 1 S");
    REQUIRE(lines[7] == "1 0 150.01 2 11 13 2.5 0 1.5 0 0 0 0 0 1 S");
}

TEST_CASE("write_catalog_csv_gaussian_list") {
    Processed p;
    auto written = p.img->write_catalog(YAML::Load("{format: csv, catalog_type: gaul}"));
    REQUIRE(written.has_value());
    REQUIRE(*written == p.dir.file("field.pybdsm.gaul.csv"));

    const auto lines = lines_of(core::read_text(*written));
    REQUIRE(lines[0] == "# Gaussian list");
    REQUIRE(lines[4] == "# Gaus_id,Isl_id,Source_id,RA,DEC,Xposn,Yposn,Total_flux,E_Total_flux,"
                        "Peak_flux,E_Peak_flux,Maj,Min,PA,Isl_rms,Isl_mean");
    REQUIRE(lines[5] == "0,0,0,150,2,10,12,2.5,0,1.5,0,0,0,0,0.01,0");
    REQUIRE(lines.size() == 7);

    REQUIRE_THROWS_AS(p.img->write_catalog(YAML::Load("{format: csv, catalog_type: gaul}")),
                      std::runtime_error);
    REQUIRE(p.img->write_catalog(YAML::Load("{format: csv, catalog_type: gaul, clobber: true}")));
}

TEST_CASE("write_catalog_json") {
    Processed p;
    p.img->results().frequency = 1.4e8;
    auto written = p.img->write_catalog(YAML::Load("{format: JSON}"));
    REQUIRE(written.has_value());
    REQUIRE(*written == p.dir.file("field.pybdsm.srl.json"));

    const nlohmann::json doc = nlohmann::json::parse(core::read_text(*written));
    REQUIRE(doc["catalog_type"] == "srl");
    REQUIRE(doc["image"] == p.input.string());
    REQUIRE(doc["frequency"].get<double>() == Catch::Approx(1.4e8));
    REQUIRE(doc["columns"].size() == 16);
    REQUIRE(doc["rows"].size() == 2);
    REQUIRE(doc["rows"][1]["Source_id"] == 1);
    REQUIRE(doc["rows"][1]["S_Code"] == "S");
    REQUIRE(doc["rows"][0]["Total_flux"].get<double>() == Catch::Approx(2.5));
}

TEST_CASE("write_catalog_rejects_unknown_options") {
    Processed p;
    REQUIRE_THROWS_AS(interface::write_catalog(*p.img, YAML::Load("{colour: red}")), ConfigError);
    REQUIRE_THROWS_AS(interface::write_catalog(*p.img, YAML::Load("{catalog_type: isl}")), ValidationError);
}

TEST_CASE("write_catalog_with_outdir") {
    Processed p;
    const fs::path outdir = p.dir.path() / "catalogs";
    YAML::Node overrides;
    overrides["outdir"] = outdir.string();
    REQUIRE(p.img->set_pars(overrides));

    auto written = p.img->write_catalog();
    REQUIRE(written.has_value());
    REQUIRE(*written == outdir / "field.pybdsm.srl");
    REQUIRE(fs::exists(*written));
}

TEST_CASE("save_and_load_pars_through_interface") {
    testing::TempDir dir("iface_pars");
    config::Options opts = testing::quiet_options();
    opts.filename = dir.file("a.fits").string();
    opts.kappa_clip = 2.5;
    Image img(opts);

    const fs::path saved = interface::save_pars(img, "");
    REQUIRE(saved == dir.file("a.fits.pybdsm.sav"));

    img.opts().kappa_clip = 4.0;
    interface::load_pars(img, saved.string());
    REQUIRE(img.opts().kappa_clip == Catch::Approx(2.5));

    REQUIRE_THROWS_AS(interface::load_pars(img, dir.file("none.sav").string()), NotFoundError);
}

TEST_CASE("list_pars_marks_changed_options") {
    config::Options opts = testing::quiet_options();
    opts.thresh_isl = 4.0;
    Image img(opts);
    std::ostringstream out;
    interface::list_pars(img, out);
    REQUIRE(out.str().find("thresh_isl") != std::string::npos);
}
