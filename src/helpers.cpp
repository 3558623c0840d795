#include "grocery/helpers.hpp"

#include <chrono>
#include <cmath>

namespace grocery {
namespace helpers {

int64_t now_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::vector<LineItem> to_line_items(const google::protobuf::RepeatedPtrField<ItemQty>& items) {
    std::vector<LineItem> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back({item.item(), item.qty()});
    }
    return out;
}

void append_items(const std::vector<LineItem>& items,
                  google::protobuf::RepeatedPtrField<ItemQty>* out) {
    for (const auto& item : items) {
        auto* entry = out->Add();
        entry->set_item(item.item);
        entry->set_qty(item.qty);
    }
}

std::vector<LineItem> flatten_order(const Order& order) {
    std::vector<LineItem> items;
    items.reserve(count_items(order));
    for (const AisleItems* aisle : {&order.bread(), &order.dairy(), &order.meat(),
                                    &order.produce(), &order.party()}) {
        for (const auto& item : aisle->items()) {
            items.push_back({item.item(), item.qty()});
        }
    }
    return items;
}

double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

} // namespace helpers
} // namespace grocery
