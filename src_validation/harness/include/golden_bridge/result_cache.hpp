#pragma once

#include <cstddef>
#include <vector>

#include "request.hpp"
#include "result_table.hpp"

namespace golden::bridge {

/**
 * \brief Session-scoped store of oracle output.
 *
 * Empty at session start, populated exactly once by the collection step and read-only
 * afterwards. Lookups hand out references to the stored tables, so every call site of
 * equal requests observes the same table object for the rest of the session.
 */
class ResultCache {
public:
    ResultCache() = default;

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// One-time bulk load. Throws CacheAlreadyPopulatedError on a second call.
    void populate(ResultMap tables);

    /// Throws CacheMissError (carrying the canonical wire line) for unknown requests.
    [[nodiscard]] const RawTable& lookup(const Request& request) const;

    [[nodiscard]] bool contains(const Request& request) const;
    [[nodiscard]] bool populated() const noexcept { return populated_; }
    [[nodiscard]] std::size_t size() const noexcept { return tables_.size(); }

    /// Cached requests in canonical order (for reports).
    [[nodiscard]] std::vector<Request> requests() const;

private:
    ResultMap tables_;
    bool populated_{false};
};

}  // namespace golden::bridge
