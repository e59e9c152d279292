#include "bdsm/store/disk_map_store.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/io/fits_io.hpp"

#include <iostream>
#include <system_error>

namespace bdsm::store {

DiskMapStore::DiskMapStore(fs::path directory, std::string owner_id, int bitpix)
    : directory_(std::move(directory)), owner_id_(std::move(owner_id)), bitpix_(bitpix) {
    if (bitpix_ != -32 && bitpix_ != -64) {
        throw CacheError("unsupported cache BITPIX " + std::to_string(bitpix_));
    }
}

DiskMapStore::~DiskMapStore() {
    std::error_code ec;
    for (const auto& key : keys_) {
        fs::remove(path_for(key), ec);
        if (ec) {
            std::cerr << "[CACHE] Cannot remove " << path_for(key) << ": " << ec.message() << std::endl;
            ec.clear();
        }
    }
    if (created_directory_ && fs::is_empty(directory_, ec)) {
        fs::remove(directory_, ec);
    }
}

fs::path DiskMapStore::path_for(const std::string& key) const {
    return directory_ / (owner_id_ + "_" + key + ".fits");
}

void DiskMapStore::ensure_directory() {
    if (fs::is_directory(directory_)) return;

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw CacheError("cannot create cache directory " + directory_.string() + ": " + ec.message());
    }
    created_directory_ = true;
}

void DiskMapStore::store(const std::string& key, const Matrix2Dd& data) {
    ensure_directory();

    const fs::path target = path_for(key);
    const fs::path tmp = directory_ / (owner_id_ + "_" + key + ".tmp.fits");

    io::FitsHeader header;
    header.set("BDSMKEY", key);
    io::write_fits_image(tmp, data, header, bitpix_);

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw CacheError("cannot move cached map into place: " + target.string());
    }
    keys_.insert(key);
}

Matrix2Dd DiskMapStore::retrieve(const std::string& key) const {
    const fs::path p = path_for(key);
    if (!fs::is_regular_file(p)) {
        throw NotFoundError("Cached map '" + key + "' not found in " + directory_.string());
    }
    return io::read_fits_image(p);
}

bool DiskMapStore::contains(const std::string& key) const {
    return fs::is_regular_file(path_for(key));
}

void DiskMapStore::remove(const std::string& key) {
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        throw CacheError("cannot remove cached map " + path_for(key).string() + ": " + ec.message());
    }
    keys_.erase(key);
}

std::vector<std::string> DiskMapStore::keys() const {
    return std::vector<std::string>(keys_.begin(), keys_.end());
}

} // namespace bdsm::store
