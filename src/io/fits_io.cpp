#include "bdsm/io/fits_io.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <set>

namespace bdsm::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) return d;
    if (auto i = get_int(key)) return static_cast<double>(*i);
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool FitsHeader::empty() const {
    return string_values.empty() && numeric_values.empty() &&
           int_values.empty() && bool_values.empty();
}

const Matrix2Dd& FitsCube::plane(int stokes, int chan) const {
    const int idx = stokes * nchan + chan;
    if (stokes < 0 || stokes >= nstokes || chan < 0 || chan >= nchan ||
        idx >= static_cast<int>(planes.size())) {
        throw FitsError("plane index out of range (stokes " + std::to_string(stokes) +
                        ", channel " + std::to_string(chan) + ")");
    }
    return planes[static_cast<size_t>(idx)];
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

static FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

FitsCube read_fits_cube(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[4] = {1, 1, 1, 1};
    int bitpix = 0;

    fits_get_img_param(fptr, 4, &bitpix, &naxis, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2 || naxis > 4) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("FITS image must have 2 to 4 axes: " + path.string());
    }

    FitsCube cube;
    cube.header = read_header(fptr);
    cube.width = static_cast<int>(naxes[0]);
    cube.height = static_cast<int>(naxes[1]);

    // Axis 3 and 4 carry frequency and Stokes in either order.
    const long n3 = naxis >= 3 ? naxes[2] : 1;
    const long n4 = naxis >= 4 ? naxes[3] : 1;
    const std::string ctype3 = core::to_upper(cube.header.get_string("CTYPE3").value_or(""));
    const bool stokes_first = core::starts_with(ctype3, "STOKES");
    cube.nchan = static_cast<int>(stokes_first ? n4 : n3);
    cube.nstokes = static_cast<int>(stokes_first ? n3 : n4);

    const long npixels = naxes[0] * naxes[1];
    std::vector<double> buffer(static_cast<size_t>(npixels));
    cube.planes.resize(static_cast<size_t>(cube.nchan * cube.nstokes));

    for (long i4 = 0; i4 < n4; ++i4) {
        for (long i3 = 0; i3 < n3; ++i3) {
            long fpixel[4] = {1, 1, i3 + 1, i4 + 1};
            int anynul = 0;
            fits_read_pix(fptr, TDOUBLE, fpixel, npixels, nullptr, buffer.data(), &anynul, &status);
            if (status) {
                int close_status = 0;
                fits_close_file(fptr, &close_status);
                throw FitsError("Cannot read FITS pixel data: " + path.string());
            }

            const long stokes = stokes_first ? i3 : i4;
            const long chan = stokes_first ? i4 : i3;
            Matrix2Dd plane(cube.height, cube.width);
            for (long y = 0; y < naxes[1]; ++y) {
                for (long x = 0; x < naxes[0]; ++x) {
                    plane(y, x) = buffer[static_cast<size_t>(y * naxes[0] + x)];
                }
            }
            cube.planes[static_cast<size_t>(stokes * cube.nchan + chan)] = std::move(plane);
        }
    }

    fits_close_file(fptr, &status);
    return cube;
}

Matrix2Dd read_fits_image(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[2] = {0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
    if (status || naxis < 2) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    Matrix2Dd data(height, width);

    long fpixel[2] = {1, 1};
    int anynul = 0;
    // Row-major storage matches the FITS pixel order.
    fits_read_pix(fptr, TDOUBLE, fpixel, width * height, nullptr, data.data(), &anynul, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    return data;
}

static bool is_structural_key(const std::string& key) {
    static const std::set<std::string> structural = {
        "SIMPLE", "BITPIX", "NAXIS", "EXTEND", "BSCALE", "BZERO",
        "BLANK", "PCOUNT", "GCOUNT", "XTENSION", "END"};
    if (structural.count(key)) return true;
    return core::starts_with(key, "NAXIS");
}

void write_fits_image(const fs::path& path, const Matrix2Dd& data,
                      const FitsHeader& header, int bitpix) {
    if (bitpix != FLOAT_IMG && bitpix != DOUBLE_IMG) {
        throw FitsError("Unsupported BITPIX " + std::to_string(bitpix));
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, bitpix, 2, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                           const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<double> buffer(static_cast<size_t>(data.size()));
    for (long y = 0; y < data.rows(); ++y) {
        for (long x = 0; x < data.cols(); ++x) {
            buffer[static_cast<size_t>(y * data.cols() + x)] = data(y, x);
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(data.size()), buffer.data(), &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace bdsm::io
