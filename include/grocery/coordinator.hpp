#pragma once

#include <string>
#include <vector>
#include "grocery/inventory.pb.h"
#include "catalog.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "pricing.hpp"
#include "publisher.hpp"
#include "task_registry.hpp"
#include "types.hpp"

namespace grocery {

/**
 * Scatter/gather coordinator for grocery and restock orders.
 *
 * process_order() validates an order, broadcasts a task descriptor to every
 * robot, blocks until all robots answered or the barrier timeout passed,
 * reconciles the OK results into the ledger exactly once, prices fetches and
 * replies. report_result() is the gather side and may run on any thread.
 *
 * A robot timeout never fails an order: the reply is still OK and reports
 * "partial: R/W robots responded". Only validation failures surface as
 * BAD_REQUEST. Pricing failures degrade to a zero price.
 *
 * Example:
 *   InventoryCoordinator coordinator(config, publisher, pricing, Catalog::standard(), 100);
 *   auto reply = coordinator.process_order(request);   // blocks on the barrier
 *   // meanwhile, from robot RPC threads:
 *   coordinator.report_result(result);
 */
class InventoryCoordinator {
public:
    InventoryCoordinator(CoordinatorConfig config, Publisher& publisher, PricingClient& pricing,
                         const Catalog& catalog = Catalog::standard(), double initial_stock = 0.0);

    InventoryCoordinator(const InventoryCoordinator&) = delete;
    InventoryCoordinator& operator=(const InventoryCoordinator&) = delete;

    /**
     * Order intake: scatter, barrier wait, reconcile, price, reply.
     */
    OrderReply process_order(const OrderRequest& request);

    /**
     * Worker result intake. Always acknowledges OK; results for unknown or
     * already-finalized tasks are logged and dropped.
     */
    RobotAck report_result(const RobotTaskResult& result);

    Ledger& ledger() { return ledger_; }
    const Ledger& ledger() const { return ledger_; }

    const TaskRegistry& registry() const { return registry_; }

    const CoordinatorConfig& config() const { return config_; }

private:
    std::vector<LineItem> reconcile(const std::string& task_id, const TaskOutcome& outcome);
    double price_items(const std::string& task_id, const std::vector<LineItem>& items);

    CoordinatorConfig config_;
    Publisher& publisher_;
    PricingClient& pricing_;
    Ledger ledger_;
    TaskRegistry registry_;
};

/**
 * Task type an order produces: FETCH for grocery orders, RESTOCK for restocks.
 *
 * @throws OrderRejectedError for any other message type
 */
TaskType task_type_for(const OrderRequest& request);

/**
 * Check an order and flatten it.
 *
 * @throws OrderRejectedError if the actor id is empty, the order has no line
 *         items, or a line has no name or a negative/non-finite quantity
 */
std::vector<LineItem> validate_order(const OrderRequest& request);

} // namespace grocery
