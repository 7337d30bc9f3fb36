#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "golden_bridge/request.hpp"
#include "golden_bridge/result_table.hpp"

namespace golden::refdump {

/**
 * \brief One reference computation the oracle can dump as CSV.
 *
 * The header of every produced table is the module's reference schema, in schema order.
 */
class DumpModule {
public:
    virtual ~DumpModule() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual std::string_view usage() const = 0;

    /// Throws std::invalid_argument on missing, malformed or out-of-range arguments.
    [[nodiscard]] virtual bridge::RawTable run(const bridge::Request& request) const = 0;
};

/// nullptr for unknown module names.
[[nodiscard]] const DumpModule* find_module(std::string_view name);

[[nodiscard]] std::vector<std::string> module_names();

}  // namespace golden::refdump
