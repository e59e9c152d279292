#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/store/disk_map_store.hpp"
#include "bdsm/store/map_store.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace bdsm;
using image::Image;

namespace {

Matrix2Dd sample_map() {
    Matrix2Dd m(3, 4);
    m << 0.1, 0.2, 0.3, 0.4,
         1.0 / 3.0, -2.5, 1e-7, 123456.789,
         0.0, -0.1, 7.0, 2.0 / 3.0;
    return m;
}

Matrix2Dd as_float32(const Matrix2Dd& m) {
    return m.cast<float>().cast<double>();
}

config::Options cached_options(const fs::path& dir, const std::string& backend = "disk") {
    config::Options opts = testing::quiet_options();
    opts.do_cache = true;
    opts.cache_backend = backend;
    opts.cache_dir = dir.string();
    return opts;
}

} // namespace

TEST_CASE("uncached_put_then_get_returns_exact_value") {
    Image img(testing::quiet_options());
    REQUIRE_FALSE(img.do_cache());

    const Matrix2Dd m = sample_map();
    img.put_map(MapId::CH0, m);

    REQUIRE(img.get_map(MapId::CH0) == m);
    REQUIRE(img.get_map("ch0") == m);
    REQUIRE(img.map_slot(MapId::CH0).has_value());
    REQUIRE(img.map_store() == nullptr);
}

TEST_CASE("uncached_put_overwrites_previous_value") {
    Image img(testing::quiet_options());
    img.put_map("rms", Matrix2Dd::Constant(2, 2, 1.0));
    img.put_map("rms", Matrix2Dd::Constant(2, 2, 2.0));
    REQUIRE(img.get_map(MapId::RMS)(1, 1) == 2.0);
}

TEST_CASE("get_map_of_unset_map_is_not_found") {
    Image img(testing::quiet_options());
    REQUIRE_THROWS_AS(img.get_map(MapId::CH0_Q), NotFoundError);
    REQUIRE_FALSE(img.has_map(MapId::CH0_Q));
}

TEST_CASE("unknown_map_name_is_a_validation_error") {
    Image img(testing::quiet_options());
    REQUIRE_THROWS_AS(img.get_map("ch7"), ValidationError);
    REQUIRE_THROWS_AS(img.put_map("ch7", Matrix2Dd::Zero(1, 1)), ValidationError);
}

TEST_CASE("disk_cache_slot_reflects_stored_value") {
    testing::TempDir dir("cache_disk");
    Image img(cached_options(dir.path()));
    REQUIRE(img.do_cache());
    REQUIRE(img.map_store() != nullptr);
    REQUIRE(img.map_store()->backend_name() == "disk");

    const Matrix2Dd raw = sample_map();
    img.put_map(MapId::CH0, raw);

    const Matrix2Dd stored = img.map_store()->retrieve(img.cache_key(MapId::CH0));
    const Matrix2Dd got = img.get_map(MapId::CH0);

    // float32 cache: the slot holds the stored value, not the raw input
    REQUIRE(got == stored);
    REQUIRE(got == as_float32(raw));
    REQUIRE(*img.map_slot(MapId::CH0) == stored);
    REQUIRE(got(1, 0) != raw(1, 0));
}

TEST_CASE("disk_cache_with_float64_keeps_exact_values") {
    testing::TempDir dir("cache_disk64");
    config::Options opts = cached_options(dir.path());
    opts.cache_bitpix = -64;
    Image img(opts);

    const Matrix2Dd raw = sample_map();
    img.put_map(MapId::MEAN, raw);
    REQUIRE(img.get_map(MapId::MEAN) == raw);
}

TEST_CASE("disk_cache_files_follow_key_layout_and_are_removed") {
    testing::TempDir dir("cache_files");
    fs::path expected;
    {
        Image img(cached_options(dir.path()));
        img.set_wavelet_scale(2);
        img.set_pi(true);
        REQUIRE(img.cache_key(MapId::CH0) == "w2_ch0_pi");

        img.put_map(MapId::CH0, sample_map());
        expected = dir.path() / (img.id() + "_w2_ch0_pi.fits");
        REQUIRE(fs::exists(expected));
        REQUIRE(img.has_map(MapId::CH0));
    }
    REQUIRE_FALSE(fs::exists(expected));
}

TEST_CASE("memory_cache_backend") {
    testing::TempDir dir("cache_mem");
    Image img(cached_options(dir.path(), "memory"));
    REQUIRE(img.map_store()->backend_name() == "memory");

    const Matrix2Dd raw = sample_map();
    img.put_map(MapId::IMAGE, raw);
    REQUIRE(img.get_map(MapId::IMAGE) == raw);
    REQUIRE(img.map_store()->contains("w0_image"));
}

TEST_CASE("changing_wavelet_scale_moves_cached_maps") {
    testing::TempDir dir("cache_rekey");
    Image img(cached_options(dir.path(), "memory"));

    const Matrix2Dd raw = sample_map();
    img.put_map(MapId::CH0, raw);
    img.set_wavelet_scale(1);
    img.set_pi(true);

    REQUIRE(img.cache_key(MapId::CH0) == "w1_ch0_pi");
    REQUIRE(img.has_map(MapId::CH0));
    REQUIRE(img.get_map(MapId::CH0) == raw);
    REQUIRE(img.map_store()->contains("w1_ch0_pi"));
    REQUIRE_FALSE(img.map_store()->contains("w0_ch0"));

    img.clear_map(MapId::CH0);
    REQUIRE_FALSE(img.has_map(MapId::CH0));
    REQUIRE(img.map_store()->keys().empty());
}

TEST_CASE("enabling_cache_pushes_existing_maps_to_the_store") {
    testing::TempDir dir("cache_enable");
    config::Options opts = testing::quiet_options();
    opts.cache_dir = dir.path().string();
    Image img(opts);

    img.put_map(MapId::CH0, sample_map());
    img.put_map(MapId::RMS, Matrix2Dd::Constant(3, 4, 0.5));

    img.set_do_cache(true);
    REQUIRE(img.opts().do_cache);
    REQUIRE(img.map_store()->contains(img.cache_key(MapId::CH0)));
    REQUIRE(img.map_store()->contains(img.cache_key(MapId::RMS)));
    REQUIRE(img.get_map(MapId::CH0) == as_float32(sample_map()));

    img.set_do_cache(false);
    REQUIRE_FALSE(img.do_cache());
    REQUIRE(img.map_store() == nullptr);
    REQUIRE(img.get_map(MapId::CH0) == as_float32(sample_map()));
}

TEST_CASE("clear_map_removes_slot_and_stored_value") {
    testing::TempDir dir("cache_clear");
    Image img(cached_options(dir.path(), "memory"));
    img.put_map(MapId::RMS, Matrix2Dd::Constant(2, 2, 1.0));
    img.clear_map(MapId::RMS);

    REQUIRE_FALSE(img.has_map(MapId::RMS));
    REQUIRE_THROWS_AS(img.get_map(MapId::RMS), NotFoundError);
}

TEST_CASE("available_maps_lists_set_slots_in_order") {
    Image img(testing::quiet_options());
    img.put_map(MapId::RMS, Matrix2Dd::Zero(2, 2));
    img.put_map(MapId::IMAGE, Matrix2Dd::Zero(2, 2));

    auto maps = img.available_maps();
    REQUIRE(maps.size() == 2);
    REQUIRE(maps[0] == MapId::IMAGE);
    REQUIRE(maps[1] == MapId::RMS);
}

TEST_CASE("disk_store_retrieve_missing_key_is_not_found") {
    testing::TempDir dir("store_missing");
    store::DiskMapStore disk(dir.path(), "owner", -32);
    REQUIRE_THROWS_AS(disk.retrieve("w0_ch0"), NotFoundError);
    REQUIRE_FALSE(disk.contains("w0_ch0"));
    REQUIRE_THROWS_AS(store::DiskMapStore(dir.path(), "owner", 16), CacheError);
}

TEST_CASE("disk_store_removes_directory_it_created") {
    testing::TempDir dir("store_dir");
    const fs::path sub = dir.path() / "nested";
    {
        store::DiskMapStore disk(sub, "owner", -32);
        disk.store("w0_rms", Matrix2Dd::Constant(2, 2, 1.0));
        REQUIRE(fs::exists(disk.path_for("w0_rms")));
        REQUIRE(disk.keys() == std::vector<std::string>{"w0_rms"});
    }
    REQUIRE_FALSE(fs::exists(sub));
}

TEST_CASE("disk_store_fails_when_directory_cannot_be_created") {
    testing::TempDir dir("store_fail");
    const fs::path blocker = dir.file("not_a_dir");
    core::write_text(blocker, "x");

    store::DiskMapStore disk(blocker / "cache", "owner", -32);
    REQUIRE_THROWS_AS(disk.store("w0_ch0", Matrix2Dd::Zero(2, 2)), CacheError);
}
