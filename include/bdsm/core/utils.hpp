#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace bdsm::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Process-unique identity for a container, "<pid>_<counter>"
std::string make_instance_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Statistical utilities
struct ClippedStats {
    double mean = 0.0;
    double rms = 0.0;
    std::size_t n = 0;
    int iterations = 0;
};

double mean_of(const std::vector<double>& v);
double stddev_of(const std::vector<double>& v);

// Iterative kappa-sigma clipping about the mean until no pixel is rejected.
ClippedStats sigma_clip(std::vector<double> values, double kappa, int max_iters = 20);

// Finite pixels of `data` whose mask entry (if any) is false.
std::vector<double> unmasked_values(const Matrix2Dd& data, const MaskArray* mask,
                                    int y0 = 0, int x0 = 0, int h = -1, int w = -1);

} // namespace bdsm::core
