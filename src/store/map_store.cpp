#include "bdsm/store/map_store.hpp"
#include "bdsm/store/disk_map_store.hpp"
#include "bdsm/config/options.hpp"
#include "bdsm/core/errors.hpp"

namespace bdsm::store {

void InMemoryMapStore::store(const std::string& key, const Matrix2Dd& data) {
    maps_[key] = data;
}

Matrix2Dd InMemoryMapStore::retrieve(const std::string& key) const {
    auto it = maps_.find(key);
    if (it == maps_.end()) {
        throw NotFoundError("Cached map '" + key + "' not found");
    }
    return it->second;
}

bool InMemoryMapStore::contains(const std::string& key) const {
    return maps_.count(key) > 0;
}

void InMemoryMapStore::remove(const std::string& key) {
    maps_.erase(key);
}

std::vector<std::string> InMemoryMapStore::keys() const {
    std::vector<std::string> out;
    out.reserve(maps_.size());
    for (const auto& [key, value] : maps_) {
        out.push_back(key);
    }
    return out;
}

std::unique_ptr<MapStore> make_map_store(const config::Options& opts,
                                         const std::string& owner_id) {
    if (opts.cache_backend == "memory") {
        return std::make_unique<InMemoryMapStore>();
    }
    if (opts.cache_backend == "disk") {
        fs::path dir = opts.cache_dir.empty()
            ? fs::temp_directory_path() / ("bdsm_cache_" + owner_id)
            : fs::path(opts.cache_dir);
        return std::make_unique<DiskMapStore>(dir, owner_id, opts.cache_bitpix);
    }
    throw ConfigError("unknown cache backend '" + opts.cache_backend + "'");
}

} // namespace bdsm::store
