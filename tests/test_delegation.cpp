#include "bdsm/core/errors.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/interface/viewer.hpp"
#include "test_support.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace bdsm;
using image::Image;

namespace {

const std::string kErrorPrefix = "\n\033[31;1mERROR\033[0m: ";

std::string thrown_message(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST_CASE("show_fit_before_processing_prints_notice_and_skips_viewer") {
    Image img(testing::quiet_options());
    auto viewer = std::make_shared<testing::RecordingViewer>();
    img.set_viewer(viewer);
    std::ostringstream console;
    img.set_console(console);

    REQUIRE_FALSE(img.show_fit());
    REQUIRE(viewer->calls == 0);
    REQUIRE(console.str() == "Image has not been processed. Please run process first.\n");
}

TEST_CASE("show_fit_before_processing_never_raises") {
    Image img(testing::quiet_options());
    std::ostringstream console;
    img.set_console(console);
    REQUIRE_NOTHROW(img.show_fit());

    img.set_interactive(true);
    REQUIRE_NOTHROW(img.show_fit());
}

TEST_CASE("show_fit_with_results_calls_viewer") {
    Image img(testing::quiet_options());
    auto viewer = std::make_shared<testing::RecordingViewer>();
    img.set_viewer(viewer);
    img.results().nisl = 0;

    REQUIRE(img.show_fit());
    REQUIRE(viewer->calls == 1);
}

TEST_CASE("show_fit_default_viewer_prints_summary") {
    Image img(testing::quiet_options());
    std::ostringstream console;
    img.set_console(console);
    img.opts().filename = "field.fits";

    auto& res = img.results();
    res.nisl = 1;
    res.gaussians = std::vector<Gaussian>(3);
    (*res.gaussians)[2].gaus_num = 2;

    REQUIRE(img.show_fit(YAML::Load("{ngaus: 2}")));
    const std::string text = console.str();
    REQUIRE(text.find("Image: field.fits") != std::string::npos);
    REQUIRE(text.find("Gaussians           : 3") != std::string::npos);
    REQUIRE(text.find("... 1 more") != std::string::npos);
}

TEST_CASE("show_fit_default_viewer_follows_console_changes") {
    Image img(testing::quiet_options());
    img.results().nisl = 1;

    auto first = std::make_unique<std::ostringstream>();
    img.set_console(*first);
    REQUIRE(img.show_fit());
    REQUIRE(first->str().find("Islands             : 1") != std::string::npos);
    first.reset();

    std::ostringstream second;
    img.set_console(second);
    REQUIRE(img.show_fit());
    REQUIRE(second.str().find("Islands             : 1") != std::string::npos);
}

TEST_CASE("show_fit_viewer_errors_follow_interactive_mode") {
    Image img(testing::quiet_options());
    std::ostringstream console;
    img.set_console(console);
    img.results().nisl = 1;

    REQUIRE(thrown_message([&] { img.show_fit(YAML::Load("{ngaus: many}")); }) ==
            "Config error: invalid value for show_fit option 'ngaus'");

    img.set_interactive(true);
    REQUIRE_FALSE(img.show_fit(YAML::Load("{ngaus: many}")));
    REQUIRE(console.str().find(kErrorPrefix + "Config error: invalid value for show_fit option 'ngaus'") !=
            std::string::npos);
}

TEST_CASE("export_image_errors_are_rethrown_with_their_message") {
    Image img(testing::quiet_options());
    img.opts().filename = "field.fits";

    REQUIRE(thrown_message([&] { img.export_image(); }) ==
            "Image type 'ch0' not available. Please run process first.");
    REQUIRE(thrown_message([&] { img.export_image(YAML::Load("{colour: red}")); }) ==
            "Config error: unknown export option 'colour'");
    REQUIRE(thrown_message([&] { img.export_image(YAML::Load("{img_type: ch9}")); }) ==
            "Validation error: Image type 'ch9' not recognized.");
}

TEST_CASE("export_image_errors_are_printed_when_interactive") {
    Image img(testing::quiet_options());
    img.opts().filename = "field.fits";
    img.set_interactive(true);
    std::ostringstream console;
    img.set_console(console);

    std::optional<fs::path> written;
    REQUIRE_NOTHROW(written = img.export_image(YAML::Load("{img_type: rms}")));
    REQUIRE_FALSE(written.has_value());
    REQUIRE(console.str() ==
            kErrorPrefix + "Image type 'rms' not available. Please run process first.\n");
}

TEST_CASE("write_catalog_errors_follow_interactive_mode") {
    Image img(testing::quiet_options());
    img.opts().filename = "field.fits";

    REQUIRE(thrown_message([&] { img.write_catalog(); }) ==
            "No sources were found in the image. Output file not written.");
    REQUIRE(thrown_message([&] { img.write_catalog(YAML::Load("{catalog_type: gaul}")); }) ==
            "No Gaussians were fit to image. Output file not written.");
    REQUIRE(thrown_message([&] { img.write_catalog(YAML::Load("{format: fits}")); }) ==
            "Validation error: format must be one of 'ascii', 'csv' or 'json'");

    img.set_interactive(true);
    std::ostringstream console;
    img.set_console(console);
    std::optional<fs::path> written;
    REQUIRE_NOTHROW(written = img.write_catalog());
    REQUIRE_FALSE(written.has_value());
    REQUIRE(console.str() ==
            kErrorPrefix + "No sources were found in the image. Output file not written.\n");
}

TEST_CASE("set_pars_errors_follow_interactive_mode") {
    Image img(testing::quiet_options());
    REQUIRE_THROWS_AS(img.set_pars(YAML::Load("{thresh_pix: -1}")), std::runtime_error);

    img.set_interactive(true);
    std::ostringstream console;
    img.set_console(console);
    REQUIRE_FALSE(img.set_pars(YAML::Load("{thresh_pix: -1}")));
    REQUIRE(console.str().rfind(kErrorPrefix, 0) == 0);
}
