#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "grocery/common.pb.h"
#include "grocery/tasks.pb.h"
#include "types.hpp"

namespace grocery {

constexpr const char* FETCH_TOPIC = "FETCH";
constexpr const char* RESTOCK_TOPIC = "RESTOCK";
constexpr const char* ANALYTICS_TOPIC = "ANALYTICS";

/**
 * Broadcast topic a task of this type is published on.
 */
std::string topic_for(TaskType task_type);

std::optional<TaskType> task_type_for_topic(const std::string& topic);

/**
 * Wire form of a task id: "fetch_12", "restock_13".
 */
std::string format_task_id(TaskType task_type, TaskId id);

/// Task type and registry id named by a wire task id.
struct TaskRef {
    TaskType task_type = TASK_TYPE_UNSPECIFIED;
    TaskId id = 0;
};

/**
 * Inverse of format_task_id(); nullopt for anything it did not produce.
 *
 * Only the canonical spelling is accepted: "fetch_01" and "fetch_0" are
 * rejected, so each TaskRef has exactly one wire form.
 */
std::optional<TaskRef> parse_task_id(const std::string& task_id);

TaskDescriptor make_task_descriptor(const std::string& task_id, TaskType task_type,
                                    const std::vector<LineItem>& items, int64_t timestamp_ms);

std::string encode_task(const TaskDescriptor& descriptor);

/**
 * Parse a broadcast payload.
 *
 * @throws DecodeError if the bytes are not a descriptor with an id and a type
 */
TaskDescriptor decode_task(const std::string& payload);

} // namespace grocery
