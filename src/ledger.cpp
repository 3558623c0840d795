#include "grocery/ledger.hpp"

#include <algorithm>
#include <cmath>

namespace grocery {

Ledger::Ledger(const Catalog& catalog, double initial_stock)
    : catalog_(catalog) {
    double seed = std::max(0.0, initial_stock);
    for (Aisle aisle : ALL_AISLES) {
        auto& shelf = stock_[aisle];
        for (const auto& item : catalog_.items_in(aisle)) {
            shelf[item] = seed;
        }
    }
}

std::vector<LineItem> Ledger::apply(TaskType task_type, const std::vector<LineItem>& items) {
    std::vector<LineItem> applied;
    if (task_type != FETCH && task_type != RESTOCK) return applied;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& line : items) {
        auto aisle = catalog_.aisle_of(line.item);
        if (!aisle) continue;
        if (!std::isfinite(line.qty) || line.qty < 0) continue;

        double& on_hand = stock_[*aisle][line.item];
        if (task_type == FETCH) {
            on_hand = std::max(0.0, on_hand - line.qty);
        } else {
            on_hand += line.qty;
        }
        applied.push_back(line);
    }
    return applied;
}

bool Ledger::set_quantity(const std::string& item, double qty) {
    auto aisle = catalog_.aisle_of(item);
    if (!aisle || !std::isfinite(qty) || qty < 0) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    stock_[*aisle][item] = qty;
    return true;
}

std::optional<double> Ledger::quantity(const std::string& item) const {
    auto aisle = catalog_.aisle_of(item);
    if (!aisle) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& shelf = stock_.at(*aisle);
    auto it = shelf.find(item);
    if (it == shelf.end()) return std::nullopt;
    return it->second;
}

std::map<Aisle, Ledger::AisleStock> Ledger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stock_;
}

Ledger::AisleStock Ledger::snapshot(Aisle aisle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stock_.at(aisle);
}

} // namespace grocery
