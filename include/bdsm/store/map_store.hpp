#pragma once

#include "bdsm/core/types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bdsm::config {
struct Options;
}

namespace bdsm::store {

/**
 * Key-value persistence for 2-D maps. A store belongs to one container;
 * keys are only unique within that container.
 */
class MapStore {
public:
    virtual ~MapStore() = default;

    /**
     * Persist `data` under `key`, replacing any previous value.
     */
    virtual void store(const std::string& key, const Matrix2Dd& data) = 0;

    /**
     * Materialize the map stored under `key`. Throws NotFoundError when
     * nothing was stored.
     */
    virtual Matrix2Dd retrieve(const std::string& key) const = 0;

    virtual bool contains(const std::string& key) const = 0;
    virtual void remove(const std::string& key) = 0;
    virtual std::vector<std::string> keys() const = 0;

    virtual std::string backend_name() const = 0;
};

class InMemoryMapStore : public MapStore {
public:
    InMemoryMapStore() = default;

    void store(const std::string& key, const Matrix2Dd& data) override;
    Matrix2Dd retrieve(const std::string& key) const override;
    bool contains(const std::string& key) const override;
    void remove(const std::string& key) override;
    std::vector<std::string> keys() const override;
    std::string backend_name() const override { return "memory"; }

private:
    std::map<std::string, Matrix2Dd> maps_;
};

/**
 * Store selected by opts.cache_backend for the container `owner_id`.
 */
std::unique_ptr<MapStore> make_map_store(const config::Options& opts,
                                         const std::string& owner_id);

} // namespace bdsm::store
