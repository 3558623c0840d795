#pragma once

#include <cstdint>
#include <string>

namespace grocery {

/// Registry-internal task identity; rendered as "<fetch|restock>_<n>" on the wire.
using TaskId = std::uint64_t;

/// One (item, quantity) pair. Quantities may be fractional (weights).
struct LineItem {
    std::string item;
    double qty = 0.0;

    bool operator==(const LineItem& other) const {
        return item == other.item && qty == other.qty;
    }
    bool operator!=(const LineItem& other) const { return !(*this == other); }
};

} // namespace grocery
