#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bdsm {

namespace fs = std::filesystem;

// Row-major maps, indexed (y, x) like the FITS pixel order
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskArray = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Named map slots held by an Image
enum class MapId {
    IMAGE = 0,      // Image data, Stokes I
    CH0 = 1,        // Channel-collapsed image data, Stokes I
    CH0_Q = 2,
    CH0_U = 3,
    CH0_V = 4,
    RMS = 5,        // Background rms map
    MEAN = 6,       // Background mean map
    RMS_QUV = 7,
    MEAN_QUV = 8,
    RESID_GAUS = 9, // Gaussian residual image
    MODEL_GAUS = 10 // Gaussian model image
};

constexpr int kMapCount = 11;

inline std::string map_id_to_string(MapId id) {
    switch (id) {
        case MapId::IMAGE: return "image";
        case MapId::CH0: return "ch0";
        case MapId::CH0_Q: return "ch0_Q";
        case MapId::CH0_U: return "ch0_U";
        case MapId::CH0_V: return "ch0_V";
        case MapId::RMS: return "rms";
        case MapId::MEAN: return "mean";
        case MapId::RMS_QUV: return "rms_QUV";
        case MapId::MEAN_QUV: return "mean_QUV";
        case MapId::RESID_GAUS: return "resid_gaus";
        case MapId::MODEL_GAUS: return "model_gaus";
        default: return "unknown";
    }
}

inline std::optional<MapId> string_to_map_id(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());

    for (int i = 0; i < kMapCount; ++i) {
        MapId id = static_cast<MapId>(i);
        if (map_id_to_string(id) == norm) return id;
    }
    return std::nullopt;
}

inline int map_id_to_int(MapId id) {
    return static_cast<int>(id);
}

inline std::vector<MapId> all_map_ids() {
    std::vector<MapId> ids;
    ids.reserve(kMapCount);
    for (int i = 0; i < kMapCount; ++i) {
        ids.push_back(static_cast<MapId>(i));
    }
    return ids;
}

// Restoring beam, degrees
struct Beam {
    double bmaj = 0.0;
    double bmin = 0.0;
    double bpa = 0.0;
};

// Island of contiguous emission
struct Island {
    int island_id = 0;
    int x = 0;          // Bounding box top-left x
    int y = 0;          // Bounding box top-left y
    int width = 0;
    int height = 0;
    int npix = 0;
    double max_value = 0.0;
    double total_flux = 0.0;
};

// Fitted Gaussian component
struct Gaussian {
    int gaus_num = 0;
    int island_id = 0;
    int source_id = 0;
    double ra = 0.0;           // deg
    double dec = 0.0;          // deg
    double x = 0.0;            // pix
    double y = 0.0;            // pix
    double total_flux = 0.0;   // Jy
    double total_flux_err = 0.0;
    double peak_flux = 0.0;    // Jy/beam
    double peak_flux_err = 0.0;
    double maj = 0.0;          // FWHM, deg
    double min = 0.0;          // FWHM, deg
    double pa = 0.0;           // deg
    double rms = 0.0;          // local background rms
    double mean = 0.0;         // local background mean
};

// Source grouped from one or more Gaussians
struct Source {
    int source_id = 0;
    int island_id = 0;
    std::string code = "S";    // S: single, M: multiple, C: shared island
    double ra = 0.0;
    double dec = 0.0;
    double x = 0.0;
    double y = 0.0;
    double total_flux = 0.0;
    double total_flux_err = 0.0;
    double peak_flux = 0.0;
    double peak_flux_err = 0.0;
    double maj = 0.0;
    double min = 0.0;
    double pa = 0.0;
    double rms = 0.0;
    int ngaus = 0;
};

} // namespace bdsm
