#pragma once

#include "bdsm/store/map_store.hpp"
#include <filesystem>
#include <set>
#include <string>

namespace bdsm::store {

namespace fs = std::filesystem;

// Maps spilled to FITS files "<directory>/<owner_id>_<key>.fits". Files
// written by the store are removed on destruction, together with the
// directory when the store created it.
class DiskMapStore : public MapStore {
public:
    DiskMapStore(fs::path directory, std::string owner_id, int bitpix = -32);
    ~DiskMapStore() override;

    DiskMapStore(const DiskMapStore&) = delete;
    DiskMapStore& operator=(const DiskMapStore&) = delete;

    void store(const std::string& key, const Matrix2Dd& data) override;
    Matrix2Dd retrieve(const std::string& key) const override;
    bool contains(const std::string& key) const override;
    void remove(const std::string& key) override;
    std::vector<std::string> keys() const override;
    std::string backend_name() const override { return "disk"; }

    fs::path path_for(const std::string& key) const;
    const fs::path& directory() const { return directory_; }
    int bitpix() const { return bitpix_; }

private:
    void ensure_directory();

    fs::path directory_;
    std::string owner_id_;
    int bitpix_;
    bool created_directory_ = false;
    std::set<std::string> keys_;
};

} // namespace bdsm::store
