#include "bdsm/core/utils.hpp"
#include "bdsm/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include <unistd.h>

namespace bdsm::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string make_instance_id() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << static_cast<long>(::getpid()) << '_' << counter.fetch_add(1);
    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

// --- Statistical utilities ---

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

double stddev_of(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double mean = mean_of(v);
    double var = 0.0;
    for (double x : v) {
        const double d = x - mean;
        var += d * d;
    }
    var /= static_cast<double>(v.size());
    return (var > 0.0) ? std::sqrt(var) : 0.0;
}

ClippedStats sigma_clip(std::vector<double> values, double kappa, int max_iters) {
    ClippedStats stats;
    if (values.empty()) return stats;

    for (int iter = 0; iter < max_iters; ++iter) {
        stats.mean = mean_of(values);
        stats.rms = stddev_of(values);
        stats.n = values.size();
        stats.iterations = iter + 1;
        if (!(stats.rms > 0.0)) break;

        std::vector<double> clipped;
        clipped.reserve(values.size());
        const double thr = kappa * stats.rms;
        for (double x : values) {
            if (std::fabs(x - stats.mean) <= thr) {
                clipped.push_back(x);
            }
        }
        if (clipped.size() == values.size() || clipped.empty()) break;
        values.swap(clipped);
    }
    stats.mean = mean_of(values);
    stats.rms = stddev_of(values);
    stats.n = values.size();
    return stats;
}

std::vector<double> unmasked_values(const Matrix2Dd& data, const MaskArray* mask,
                                    int y0, int x0, int h, int w) {
    const int rows = static_cast<int>(data.rows());
    const int cols = static_cast<int>(data.cols());
    if (h < 0) h = rows - y0;
    if (w < 0) w = cols - x0;
    const int y1 = std::min(rows, y0 + h);
    const int x1 = std::min(cols, x0 + w);

    std::vector<double> out;
    out.reserve(static_cast<size_t>(std::max(0, y1 - y0)) * static_cast<size_t>(std::max(0, x1 - x0)));
    for (int y = std::max(0, y0); y < y1; ++y) {
        for (int x = std::max(0, x0); x < x1; ++x) {
            if (mask && (*mask)(y, x)) continue;
            const double v = data(y, x);
            if (std::isfinite(v)) out.push_back(v);
        }
    }
    return out;
}

} // namespace bdsm::core
