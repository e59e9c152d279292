#include "bdsm/core/errors.hpp"
#include "bdsm/io/fits_io.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace bdsm;

TEST_CASE("fits_image_path_extensions") {
    REQUIRE(io::is_fits_image_path("sky.fits"));
    REQUIRE(io::is_fits_image_path("SKY.FTS"));
    REQUIRE_FALSE(io::is_fits_image_path("sky.png"));
}

TEST_CASE("write_then_read_image_keeps_orientation_and_header") {
    testing::TempDir dir("fits_rw");
    Matrix2Dd data(2, 3);
    data << 1.0, 2.0, 3.0,
            4.0, 5.0, 6.0;

    io::FitsHeader header;
    header.set("OBJECT", std::string("3C196"));
    header.set("BMAJ", 0.002);
    header.set("NAXIS1", 99); // structural keys are not copied

    const fs::path p = dir.file("plane.fits");
    io::write_fits_image(p, data, header, -64);

    Matrix2Dd back = io::read_fits_image(p);
    REQUIRE(back.rows() == 2);
    REQUIRE(back.cols() == 3);
    REQUIRE(back == data);

    io::FitsCube cube = io::read_fits_cube(p);
    REQUIRE(cube.width == 3);
    REQUIRE(cube.height == 2);
    REQUIRE(cube.nchan == 1);
    REQUIRE(cube.nstokes == 1);
    REQUIRE(cube.header.get_string("OBJECT") == std::string("3C196"));
    REQUIRE(cube.header.get_number("BMAJ").value() == Catch::Approx(0.002));
    REQUIRE(cube.header.get_number("NAXIS1").value() == Catch::Approx(3.0));
}

TEST_CASE("write_image_rejects_unsupported_bitpix") {
    testing::TempDir dir("fits_bitpix");
    REQUIRE_THROWS_AS(io::write_fits_image(dir.file("x.fits"), Matrix2Dd::Zero(2, 2), {}, 16),
                      FitsError);
}

TEST_CASE("read_missing_file_is_a_fits_error") {
    REQUIRE_THROWS_AS(io::read_fits_cube("/nonexistent/dir/none.fits"), FitsError);
    REQUIRE_THROWS_AS(io::read_fits_image("/nonexistent/dir/none.fits"), IOError);
}

TEST_CASE("read_cube_orders_planes_by_stokes_and_channel") {
    testing::TempDir dir("fits_cube");
    testing::CubeSpec spec;
    spec.width = 4;
    spec.height = 3;
    spec.nchan = 2;
    spec.nstokes = 4;

    const fs::path p = dir.file("cube.fits");
    testing::write_test_cube(p, spec, [](int x, int y, int chan, int stokes) {
        return 100.0 * stokes + 10.0 * chan + x + 0.5 * y;
    });

    io::FitsCube cube = io::read_fits_cube(p);
    REQUIRE(cube.nchan == 2);
    REQUIRE(cube.nstokes == 4);
    REQUIRE(cube.plane(0, 0)(0, 0) == 0.0);
    REQUIRE(cube.plane(3, 1)(2, 3) == Catch::Approx(300.0 + 10.0 + 3.0 + 1.0));
    REQUIRE_THROWS_AS(cube.plane(4, 0), FitsError);
}

TEST_CASE("read_cube_with_stokes_as_third_axis") {
    testing::TempDir dir("fits_stokes3");
    testing::CubeSpec spec;
    spec.width = 2;
    spec.height = 2;
    spec.nchan = 3;
    spec.nstokes = 2;
    spec.stokes_axis_first = true;

    const fs::path p = dir.file("cube.fits");
    testing::write_test_cube(p, spec, [](int, int, int chan, int stokes) {
        return 10.0 * stokes + chan;
    });

    io::FitsCube cube = io::read_fits_cube(p);
    REQUIRE(cube.nchan == 3);
    REQUIRE(cube.nstokes == 2);
    REQUIRE(cube.plane(1, 2)(1, 1) == 12.0);
    REQUIRE(cube.plane(0, 1)(0, 0) == 1.0);
}
