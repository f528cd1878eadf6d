#include "catalog/region_catalog.hpp"
#include "config/config_loader.hpp"

#include <format>
#include <limits>
#include <stdexcept>

namespace regionrouter {

RegionCatalog::RegionCatalog(RouterConfig config)
    : config_(std::move(config)) {
    const auto errors = ConfigLoader::validate_config(config_);
    if (!errors.empty()) {
        std::string combined = "Invalid region catalog:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw std::invalid_argument(combined);
    }

    const auto& global_endpoints = config_.failover.health_check.endpoints;
    index_.reserve(config_.regions.size());
    for (size_t i = 0; i < config_.regions.size(); ++i) {
        auto& region = config_.regions[i];
        if (region.health_endpoints.empty()) {
            region.health_endpoints = global_endpoints.empty()
                ? std::vector<HealthEndpoint>{HealthEndpoint{}}
                : global_endpoints;
        }
        index_.emplace(region.id, i);
    }
}

Result<RegionCatalog> RegionCatalog::load(const std::string& config_path) {
    auto result = ConfigLoader::load_from_file(config_path);
    if (!result.success) {
        return Result<RegionCatalog>::error(ErrorCategory::CONFIG_ERROR, result.error_message);
    }
    try {
        return Result<RegionCatalog>::ok(RegionCatalog(std::move(result.config)));
    } catch (const std::invalid_argument& e) {
        return Result<RegionCatalog>::error(ErrorCategory::CONFIG_ERROR, e.what());
    }
}

std::vector<const RegionConfig*> RegionCatalog::active_regions() const {
    std::vector<const RegionConfig*> active;
    active.reserve(config_.regions.size());
    for (const auto& region : config_.regions) {
        if (region.is_active()) {
            active.push_back(&region);
        }
    }
    return active;
}

const RegionConfig* RegionCatalog::by_id(const std::string& region_id) const {
    const auto it = index_.find(region_id);
    return (it != index_.end()) ? &config_.regions[it->second] : nullptr;
}

bool RegionCatalog::contains(const std::string& region_id) const {
    return index_.contains(region_id);
}

size_t RegionCatalog::index_of(const std::string& region_id) const {
    const auto it = index_.find(region_id);
    return (it != index_.end()) ? it->second : std::numeric_limits<size_t>::max();
}

std::vector<std::string> RegionCatalog::region_ids() const {
    std::vector<std::string> ids;
    ids.reserve(config_.regions.size());
    for (const auto& region : config_.regions) {
        ids.push_back(region.id);
    }
    return ids;
}

} // namespace regionrouter
