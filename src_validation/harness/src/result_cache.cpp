#include "golden_bridge/result_cache.hpp"
#include "golden_bridge/errors.hpp"

#include <algorithm>
#include <utility>

namespace golden::bridge {

void ResultCache::populate(ResultMap tables) {
    if (populated_) {
        throw CacheAlreadyPopulatedError();
    }
    tables_ = std::move(tables);
    populated_ = true;
}

const RawTable& ResultCache::lookup(const Request& request) const {
    const auto it = tables_.find(request);
    if (it == tables_.end()) {
        throw CacheMissError(request.to_wire_line());
    }
    return it->second;
}

bool ResultCache::contains(const Request& request) const {
    return tables_.find(request) != tables_.end();
}

std::vector<Request> ResultCache::requests() const {
    std::vector<Request> keys;
    keys.reserve(tables_.size());
    for (const auto& entry : tables_) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace golden::bridge
