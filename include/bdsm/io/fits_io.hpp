#pragma once

#include "bdsm/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bdsm::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    // Numeric lookup accepting both integer and floating point cards.
    std::optional<double> get_number(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    bool empty() const;
};

// Image planes of a FITS file with up to four axes (x, y, frequency, Stokes).
struct FitsCube {
    int width = 0;
    int height = 0;
    int nchan = 1;
    int nstokes = 1;
    std::vector<Matrix2Dd> planes; // index: stokes * nchan + chan
    FitsHeader header;

    const Matrix2Dd& plane(int stokes, int chan) const;
};

bool is_fits_image_path(const fs::path& path);

FitsCube read_fits_cube(const fs::path& path);

// First image plane only.
Matrix2Dd read_fits_image(const fs::path& path);

// bitpix: -32 writes float32 pixels, -64 float64.
void write_fits_image(const fs::path& path, const Matrix2Dd& data,
                      const FitsHeader& header, int bitpix = -32);

} // namespace bdsm::io
