#pragma once

/**
 * Grocery fulfillment library
 *
 * Main include file - includes all public headers except the ZeroMQ
 * transport (grocery/zmq_channel.hpp), which only the service binaries need.
 */

// Error types and logging
#include "errors.hpp"
#include "logging.hpp"

// Wire helpers and validation
#include "helpers.hpp"
#include "validation.hpp"
#include "task_codec.hpp"

// Store model
#include "catalog.hpp"
#include "ledger.hpp"
#include "task_registry.hpp"

// Coordinator and its collaborators
#include "config.hpp"
#include "publisher.hpp"
#include "pricing.hpp"
#include "coordinator.hpp"
#include "robot.hpp"
#include "analytics.hpp"
#include "order_json.hpp"
