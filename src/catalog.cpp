#include "grocery/catalog.hpp"

namespace grocery {

std::string to_string(Aisle aisle) {
    switch (aisle) {
        case Aisle::Bread: return "bread";
        case Aisle::Dairy: return "dairy";
        case Aisle::Meat: return "meat";
        case Aisle::Produce: return "produce";
        case Aisle::Party: return "party";
    }
    return "unknown";
}

std::optional<Aisle> parse_aisle(const std::string& name) {
    for (Aisle aisle : ALL_AISLES) {
        if (to_string(aisle) == name) return aisle;
    }
    return std::nullopt;
}

const Catalog& Catalog::standard() {
    static const Catalog catalog({
        {"bagels", Aisle::Bread, 3.99},
        {"bread", Aisle::Bread, 2.49},
        {"waffles", Aisle::Bread, 4.29},
        {"tortillas", Aisle::Bread, 3.49},
        {"buns", Aisle::Bread, 2.99},

        {"milk", Aisle::Dairy, 4.59},
        {"eggs", Aisle::Dairy, 3.99},
        {"cheese", Aisle::Dairy, 5.49},
        {"yogurt", Aisle::Dairy, 1.29},
        {"butter", Aisle::Dairy, 4.99},

        {"chicken", Aisle::Meat, 8.99},
        {"beef", Aisle::Meat, 11.99},
        {"pork", Aisle::Meat, 7.49},
        {"turkey", Aisle::Meat, 9.49},
        {"fish", Aisle::Meat, 12.99},

        {"tomatoes", Aisle::Produce, 2.99},
        {"onions", Aisle::Produce, 1.49},
        {"apples", Aisle::Produce, 1.99},
        {"oranges", Aisle::Produce, 2.49},
        {"lettuce", Aisle::Produce, 1.79},

        {"soda", Aisle::Party, 1.99},
        {"paper_plates", Aisle::Party, 3.49},
        {"napkins", Aisle::Party, 2.49},
        {"chips", Aisle::Party, 4.29},
        {"cups", Aisle::Party, 2.99},
    });
    return catalog;
}

Catalog::Catalog(const std::vector<Entry>& entries) {
    for (Aisle aisle : ALL_AISLES) {
        items_by_aisle_[aisle];
    }
    for (const auto& entry : entries) {
        // Item names are unique across aisles; the first registration wins.
        if (!aisle_by_item_.emplace(entry.item, entry.aisle).second) continue;
        price_by_item_[entry.item] = entry.unit_price;
        items_by_aisle_[entry.aisle].push_back(entry.item);
    }
}

std::optional<Aisle> Catalog::aisle_of(const std::string& item) const {
    auto it = aisle_by_item_.find(item);
    if (it == aisle_by_item_.end()) return std::nullopt;
    return it->second;
}

const std::vector<std::string>& Catalog::items_in(Aisle aisle) const {
    return items_by_aisle_.at(aisle);
}

double Catalog::unit_price(const std::string& item) const {
    auto it = price_by_item_.find(item);
    return it != price_by_item_.end() ? it->second : 0.0;
}

} // namespace grocery
