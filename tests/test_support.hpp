#pragma once

#include "bdsm/config/options.hpp"
#include "bdsm/core/types.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/interface/viewer.hpp"
#include "bdsm/pipeline/op.hpp"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bdsm::testing {

// Fresh directory under the system temp path, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path file(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

config::Options quiet_options();

// Pixel value for (x, y, channel, stokes).
using PixelFn = std::function<double(int, int, int, int)>;

struct CubeSpec {
    int width = 32;
    int height = 32;
    int nchan = 1;
    int nstokes = 1;
    bool stokes_axis_first = false; // CTYPE3 = STOKES
    std::map<std::string, double> numeric_keys;
    std::map<std::string, std::string> string_keys;
};

// Writes a float64 FITS cube (2 to 4 axes, depending on nchan/nstokes).
void write_test_cube(const fs::path& path, const CubeSpec& spec, const PixelFn& pixel);

// Deterministic pseudo-noise in [-amplitude, amplitude].
double pseudo_noise(int x, int y, double amplitude);

// Stage that records its runs and fills results the way a source finder would.
class FakeSourceFinder : public pipeline::Op {
public:
    std::string name() const override { return "fake_finder"; }
    std::vector<std::string> depends_on() const override { return {"thresh_isl"}; }
    pipeline::OpOutputs provides() const override;
    void run(image::Image& img) override;

    int runs = 0;
    int ngaussians = 2;
};

// Stage with configurable dependencies that only counts its runs.
class CountingOp : public pipeline::Op {
public:
    CountingOp(std::string name, std::vector<std::string> deps,
               std::vector<MapId> maps = {}, bool fail = false)
        : name_(std::move(name)), deps_(std::move(deps)), maps_(std::move(maps)), fail_(fail) {}

    std::string name() const override { return name_; }
    std::vector<std::string> depends_on() const override { return deps_; }
    pipeline::OpOutputs provides() const override { return {maps_, {}}; }
    void run(image::Image& img) override;

    int runs = 0;

private:
    std::string name_;
    std::vector<std::string> deps_;
    std::vector<MapId> maps_;
    bool fail_ = false;
};

class RecordingViewer : public interface::ResultsViewer {
public:
    void show(const image::Image& img, const YAML::Node& options) override;

    int calls = 0;
};

} // namespace bdsm::testing
