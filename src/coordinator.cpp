#include "grocery/coordinator.hpp"

#include <utility>
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"
#include "grocery/logging.hpp"
#include "grocery/task_codec.hpp"
#include "grocery/validation.hpp"

namespace grocery {

namespace {

constexpr const char* LOG_DOMAIN = "coordinator";

OrderReply make_reply(ReplyCode code, const std::string& message) {
    OrderReply reply;
    reply.set_code(code);
    reply.set_message(message);
    return reply;
}

std::string completion_message(const TaskOutcome& outcome, std::size_t processed) {
    if (outcome.all_responded) {
        return "completed: " + std::to_string(processed) + " items processed";
    }
    return "partial: " + std::to_string(outcome.responded()) + "/" +
           std::to_string(outcome.expected_responses) + " robots responded, " +
           std::to_string(processed) + " items processed";
}

} // anonymous namespace

TaskType task_type_for(const OrderRequest& request) {
    switch (request.message_type()) {
        case GROCERY_ORDER: return FETCH;
        case RESTOCK_ORDER: return RESTOCK;
        default:
            throw OrderRejectedError("message_type must be GROCERY_ORDER or RESTOCK_ORDER");
    }
}

std::vector<LineItem> validate_order(const OrderRequest& request) {
    const char* actor_field = request.message_type() == RESTOCK_ORDER ? "supplier_id" : "customer_id";
    validation::require_not_empty(helpers::actor_id(request), actor_field);

    auto items = helpers::flatten_order(request.order());
    validation::require_not_empty(items, "order");
    for (const auto& line : items) {
        validation::require_not_empty(line.item, "item name");
        validation::require_finite(line.qty, "quantity of " + line.item);
        validation::require_non_negative(line.qty, "quantity of " + line.item);
    }
    return items;
}

InventoryCoordinator::InventoryCoordinator(CoordinatorConfig config, Publisher& publisher,
                                           PricingClient& pricing, const Catalog& catalog,
                                           double initial_stock)
    : config_(std::move(config)),
      publisher_(publisher),
      pricing_(pricing),
      ledger_(catalog, initial_stock),
      registry_(config_.expected_robots) {
    config_.validate();
}

OrderReply InventoryCoordinator::process_order(const OrderRequest& request) {
    TaskType task_type = TASK_TYPE_UNSPECIFIED;
    std::vector<LineItem> items;
    try {
        task_type = task_type_for(request);
        items = validate_order(request);
    } catch (const OrderRejectedError& e) {
        log_warn(LOG_DOMAIN, "order_rejected", {{"reason", e.what()}});
        return make_reply(BAD_REQUEST, e.what());
    }

    TaskId id = registry_.next_task_id();
    std::string task_id = format_task_id(task_type, id);
    auto deadline = TaskRegistry::Clock::now() + config_.barrier_timeout;
    auto descriptor = make_task_descriptor(task_id, task_type, items, helpers::now_ms());

    if (!registry_.create(id, task_type, std::move(items), deadline)) {
        log_error(LOG_DOMAIN, "duplicate_task_id", {{"task_id", task_id}});
        return make_reply(INTERNAL_ERROR, "duplicate task id " + task_id);
    }

    try {
        publisher_.publish(topic_for(task_type), encode_task(descriptor));
    } catch (const std::exception& e) {
        registry_.finalize_and_remove(id);
        log_error(LOG_DOMAIN, "task_publish_failed", {{"task_id", task_id}, {"error", e.what()}});
        return make_reply(INTERNAL_ERROR, "failed to dispatch " + task_id + ": " + e.what());
    }
    log_info(LOG_DOMAIN, "task_published",
        {{"task_id", task_id}, {"topic", topic_for(task_type)},
         {"item_count", descriptor.items_size()}});

    registry_.wait_for_completion(id);
    auto outcome = registry_.finalize_and_remove(id);
    if (!outcome) {
        log_error(LOG_DOMAIN, "task_vanished", {{"task_id", task_id}});
        return make_reply(INTERNAL_ERROR, "task " + task_id + " was finalized twice");
    }

    auto processed = reconcile(task_id, *outcome);

    OrderReply reply = make_reply(OK, completion_message(*outcome, processed.size()));
    helpers::append_items(processed, reply.mutable_items());
    if (task_type == FETCH) {
        reply.set_total_price(processed.empty() ? 0.0 : price_items(task_id, processed));
    }

    log_info(LOG_DOMAIN, "order_completed",
        {{"task_id", task_id}, {"responded", outcome->responded()},
         {"expected", outcome->expected_responses}, {"items_processed", processed.size()},
         {"all_responded", outcome->all_responded}});
    return reply;
}

RobotAck InventoryCoordinator::report_result(const RobotTaskResult& result) {
    RobotAck ack;
    ack.set_code(OK);

    RecordOutcome recorded;
    if (auto ref = parse_task_id(result.task_id())) {
        recorded = registry_.record_result(ref->id, ref->task_type, result);
    }

    if (!recorded.recorded) {
        // Robots race finalization all the time; this is not their fault.
        log_warn(LOG_DOMAIN, "late_result_discarded",
            {{"task_id", result.task_id()}, {"robot_id", result.robot_id()}});
        ack.set_message("discarded: task " + result.task_id() + " is not awaiting results");
        return ack;
    }

    log_info(LOG_DOMAIN, "result_recorded",
        {{"task_id", result.task_id()}, {"robot_id", result.robot_id()},
         {"item_count", result.items_size()}, {"last", recorded.first_to_complete}});
    ack.set_message("recorded");
    return ack;
}

std::vector<LineItem> InventoryCoordinator::reconcile(const std::string& task_id,
                                                       const TaskOutcome& outcome) {
    std::vector<LineItem> reported;
    for (const auto& result : outcome.results) {
        if (result.code() != OK) {
            log_warn(LOG_DOMAIN, "robot_reported_error",
                {{"task_id", task_id}, {"robot_id", result.robot_id()},
                 {"message", result.message()}});
            continue;
        }
        auto items = helpers::to_line_items(result.items());
        reported.insert(reported.end(), items.begin(), items.end());
    }

    auto applied = ledger_.apply(outcome.task_type, reported);
    if (applied.size() != reported.size()) {
        log_warn(LOG_DOMAIN, "items_skipped",
            {{"task_id", task_id}, {"skipped", reported.size() - applied.size()}});
    }
    return applied;
}

double InventoryCoordinator::price_items(const std::string& task_id,
                                         const std::vector<LineItem>& items) {
    try {
        return pricing_.total_price(items);
    } catch (const std::exception& e) {
        log_warn(LOG_DOMAIN, "pricing_failed", {{"task_id", task_id}, {"error", e.what()}});
        return 0.0;
    }
}

} // namespace grocery
