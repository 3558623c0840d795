#pragma once

#include <memory>
#include "grocery/coordinator.hpp"
#include "grocery/inventory.grpc.pb.h"
#include "grocery/publisher.hpp"

namespace inventory {

/// Order intake and diagnostics. Emits one analytics event per order on `analytics`.
std::unique_ptr<grocery::InventoryService::Service> create_inventory_service(
    grocery::InventoryCoordinator& coordinator, grocery::Publisher& analytics);

/// Robot result intake.
std::unique_ptr<grocery::InventoryRobotService::Service> create_robot_result_service(
    grocery::InventoryCoordinator& coordinator);

}  // namespace inventory
