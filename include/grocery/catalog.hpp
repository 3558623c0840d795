#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace grocery {

/// The fixed set of aisles; one robot serves each.
enum class Aisle {
    Bread,
    Dairy,
    Meat,
    Produce,
    Party
};

constexpr std::array<Aisle, 5> ALL_AISLES = {
    Aisle::Bread, Aisle::Dairy, Aisle::Meat, Aisle::Produce, Aisle::Party
};

std::string to_string(Aisle aisle);

/**
 * Parse a lowercase aisle name ("bread", "dairy", ...).
 */
std::optional<Aisle> parse_aisle(const std::string& name);

/**
 * Static item tables: which aisle stocks an item and what one unit costs.
 *
 * Built once and never mutated afterwards, so a single instance is shared
 * read-only by the ledger, the robots and the pricing service.
 */
class Catalog {
public:
    /**
     * The store's standard catalog (25 items over 5 aisles).
     */
    static const Catalog& standard();

    struct Entry {
        std::string item;
        Aisle aisle;
        double unit_price;
    };

    explicit Catalog(const std::vector<Entry>& entries);

    std::optional<Aisle> aisle_of(const std::string& item) const;

    bool contains(const std::string& item) const { return aisle_of(item).has_value(); }

    /**
     * Items stocked in an aisle, in catalog order.
     */
    const std::vector<std::string>& items_in(Aisle aisle) const;

    /**
     * Per-unit price; 0 for items the catalog does not know.
     */
    double unit_price(const std::string& item) const;

private:
    std::unordered_map<std::string, Aisle> aisle_by_item_;
    std::unordered_map<std::string, double> price_by_item_;
    std::map<Aisle, std::vector<std::string>> items_by_aisle_;
};

} // namespace grocery
