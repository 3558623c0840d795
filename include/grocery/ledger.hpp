#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "grocery/common.pb.h"
#include "catalog.hpp"
#include "types.hpp"

namespace grocery {

/**
 * Authoritative in-memory stock levels, grouped by aisle.
 *
 * Quantities never go below zero: FETCH subtracts with a floor at zero and
 * silently drops excess demand; RESTOCK adds without an upper bound. Every
 * batch passed to apply() lands under one lock, so a reader never sees half
 * of one task's reconciliation.
 *
 * Example:
 *   Ledger ledger(Catalog::standard(), 100);
 *   ledger.apply(FETCH, {{"bagels", 2}});
 *   ledger.quantity("bagels");  // 98
 */
class Ledger {
public:
    using AisleStock = std::map<std::string, double>;

    /**
     * Seed every catalog item with the same on-hand quantity.
     */
    explicit Ledger(const Catalog& catalog = Catalog::standard(), double initial_stock = 0.0);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /**
     * Apply one task's items atomically.
     *
     * Items the catalog does not know, and items with a negative or non-finite
     * quantity, are skipped.
     *
     * @return The items that were applied, in input order
     */
    std::vector<LineItem> apply(TaskType task_type, const std::vector<LineItem>& items);

    /**
     * Overwrite the on-hand quantity of a known item.
     *
     * @return false if the item is unknown or the quantity is negative
     */
    bool set_quantity(const std::string& item, double qty);

    std::optional<double> quantity(const std::string& item) const;

    std::map<Aisle, AisleStock> snapshot() const;

    AisleStock snapshot(Aisle aisle) const;

private:
    const Catalog& catalog_;
    mutable std::mutex mutex_;
    std::map<Aisle, AisleStock> stock_;
};

} // namespace grocery
