#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "grocery/inventory.grpc.pb.h"
#include "grocery/inventory.pb.h"
#include "grocery/tasks.pb.h"
#include "catalog.hpp"
#include "types.hpp"

namespace grocery {

/**
 * Where a robot sends its result; the coordinator's worker-result intake.
 */
class ResultReporter {
public:
    virtual ~ResultReporter() = default;

    /**
     * @throws GroceryError if the result could not be delivered
     */
    virtual void report(const RobotTaskResult& result) = 0;
};

/**
 * ResultReporter over gRPC (InventoryRobotService.ReportTaskResult).
 */
class GrpcResultReporter : public ResultReporter {
public:
    static constexpr std::chrono::milliseconds DEFAULT_DEADLINE{5000};

    static std::unique_ptr<GrpcResultReporter> connect(
        const std::string& endpoint, std::chrono::milliseconds deadline = DEFAULT_DEADLINE);

    explicit GrpcResultReporter(std::shared_ptr<grpc::Channel> channel,
                                std::chrono::milliseconds deadline = DEFAULT_DEADLINE);

    /**
     * @throws GrpcError if the call fails
     */
    void report(const RobotTaskResult& result) override;

private:
    std::unique_ptr<InventoryRobotService::Stub> stub_;
    std::chrono::milliseconds deadline_;
};

/**
 * One aisle robot.
 *
 * Every broadcast task reaches every robot; each keeps only the items its
 * aisle stocks and always reports back, even with nothing to do, because the
 * coordinator's barrier counts responses rather than items.
 */
class RobotWorker {
public:
    RobotWorker(std::string robot_id, Aisle aisle, ResultReporter& reporter,
                std::chrono::milliseconds work_time = std::chrono::milliseconds(0),
                const Catalog& catalog = Catalog::standard());

    /**
     * Process one broadcast frame and report the result.
     *
     * @return The result sent, or nullopt if the frame was not a task this
     *         robot could decode
     */
    std::optional<RobotTaskResult> handle(const std::string& topic, const std::string& payload);

    /**
     * The subset of a task this robot's aisle is responsible for.
     */
    std::vector<LineItem> select_items(const TaskDescriptor& descriptor) const;

    const std::string& robot_id() const { return robot_id_; }
    Aisle aisle() const { return aisle_; }

private:
    RobotTaskResult build_result(const std::string& topic, const TaskDescriptor& descriptor,
                                 const std::vector<LineItem>& mine) const;

    std::string robot_id_;
    Aisle aisle_;
    ResultReporter& reporter_;
    std::chrono::milliseconds work_time_;
    const Catalog& catalog_;
};

} // namespace grocery
