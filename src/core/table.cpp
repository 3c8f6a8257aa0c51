#include <fleetfuel/core/table.hpp>

#include <algorithm>

namespace fleetfuel {

auto ColumnEntry::present_count() const noexcept -> std::size_t {
    if (!validity.has_value()) {
        return values.size();
    }
    return static_cast<std::size_t>(std::count(validity->begin(), validity->end(), true));
}

}  // namespace fleetfuel
