#include "grocery/robot.hpp"

#include <thread>
#include <utility>
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"
#include "grocery/logging.hpp"
#include "grocery/task_codec.hpp"

namespace grocery {

namespace {
constexpr const char* LOG_DOMAIN = "robot";
} // anonymous namespace

std::unique_ptr<GrpcResultReporter> GrpcResultReporter::connect(
    const std::string& endpoint, std::chrono::milliseconds deadline) {
    auto channel = grpc::CreateChannel(helpers::format_endpoint(endpoint),
                                       grpc::InsecureChannelCredentials());
    return std::make_unique<GrpcResultReporter>(channel, deadline);
}

GrpcResultReporter::GrpcResultReporter(std::shared_ptr<grpc::Channel> channel,
                                       std::chrono::milliseconds deadline)
    : stub_(InventoryRobotService::NewStub(channel)), deadline_(deadline) {}

void GrpcResultReporter::report(const RobotTaskResult& result) {
    RobotAck ack;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
    auto status = stub_->ReportTaskResult(&context, result, &ack);
    if (!status.ok()) {
        throw GrpcError(status.error_message(), status.error_code());
    }
}

RobotWorker::RobotWorker(std::string robot_id, Aisle aisle, ResultReporter& reporter,
                         std::chrono::milliseconds work_time, const Catalog& catalog)
    : robot_id_(std::move(robot_id)),
      aisle_(aisle),
      reporter_(reporter),
      work_time_(work_time),
      catalog_(catalog) {}

std::optional<RobotTaskResult> RobotWorker::handle(const std::string& topic,
                                                   const std::string& payload) {
    if (!task_type_for_topic(topic)) return std::nullopt;

    TaskDescriptor descriptor;
    try {
        descriptor = decode_task(payload);
    } catch (const DecodeError& e) {
        log_warn(LOG_DOMAIN, "task_decode_failed",
            {{"robot_id", robot_id_}, {"topic", topic}, {"error", e.what()}});
        return std::nullopt;
    }

    auto mine = select_items(descriptor);
    log_info(LOG_DOMAIN, "task_received",
        {{"robot_id", robot_id_}, {"topic", topic}, {"task_id", descriptor.task_id()},
         {"all_items", descriptor.items_size()}, {"my_items", mine.size()}});

    if (!mine.empty() && work_time_.count() > 0) {
        std::this_thread::sleep_for(work_time_);
    }

    auto result = build_result(topic, descriptor, mine);
    try {
        reporter_.report(result);
        log_info(LOG_DOMAIN, "result_sent",
            {{"robot_id", robot_id_}, {"task_id", descriptor.task_id()}, {"items", mine.size()}});
    } catch (const GroceryError& e) {
        log_error(LOG_DOMAIN, "result_report_failed",
            {{"robot_id", robot_id_}, {"task_id", descriptor.task_id()}, {"error", e.what()}});
    }
    return result;
}

std::vector<LineItem> RobotWorker::select_items(const TaskDescriptor& descriptor) const {
    std::vector<LineItem> mine;
    for (const auto& item : descriptor.items()) {
        if (catalog_.aisle_of(item.item()) == aisle_) {
            mine.push_back({item.item(), item.qty()});
        }
    }
    return mine;
}

RobotTaskResult RobotWorker::build_result(const std::string& topic, const TaskDescriptor& descriptor,
                                          const std::vector<LineItem>& mine) const {
    const std::string aisle_name = to_string(aisle_);

    RobotTaskResult result;
    result.set_robot_id(robot_id_);
    result.set_task_id(descriptor.task_id());
    result.set_code(OK);
    if (mine.empty()) {
        result.set_message(topic + " completed by " + robot_id_ + ": 0 items (no " +
                           aisle_name + " items in order)");
    } else {
        result.set_message(topic + " completed by " + robot_id_ + ": " +
                           std::to_string(mine.size()) + " items from " + aisle_name);
    }
    result.set_timestamp_ms(helpers::now_ms());
    helpers::append_items(mine, result.mutable_items());
    return result;
}

} // namespace grocery
