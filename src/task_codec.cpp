#include "grocery/task_codec.hpp"

#include <cctype>
#include <stdexcept>
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"

namespace grocery {

namespace {

constexpr const char* FETCH_PREFIX = "fetch_";
constexpr const char* RESTOCK_PREFIX = "restock_";

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::string topic_for(TaskType task_type) {
    return task_type == RESTOCK ? RESTOCK_TOPIC : FETCH_TOPIC;
}

std::optional<TaskType> task_type_for_topic(const std::string& topic) {
    if (topic == FETCH_TOPIC) return FETCH;
    if (topic == RESTOCK_TOPIC) return RESTOCK;
    return std::nullopt;
}

std::string format_task_id(TaskType task_type, TaskId id) {
    return (task_type == RESTOCK ? RESTOCK_PREFIX : FETCH_PREFIX) + std::to_string(id);
}

std::optional<TaskRef> parse_task_id(const std::string& task_id) {
    TaskRef ref;
    std::string digits;
    if (starts_with(task_id, FETCH_PREFIX)) {
        ref.task_type = FETCH;
        digits = task_id.substr(std::string(FETCH_PREFIX).size());
    } else if (starts_with(task_id, RESTOCK_PREFIX)) {
        ref.task_type = RESTOCK;
        digits = task_id.substr(std::string(RESTOCK_PREFIX).size());
    } else {
        return std::nullopt;
    }

    // Ids start at 1 and are printed without padding.
    if (digits.empty() || digits.size() > 20 || digits[0] == '0') return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        ref.id = static_cast<TaskId>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return ref;
}

TaskDescriptor make_task_descriptor(const std::string& task_id, TaskType task_type,
                                    const std::vector<LineItem>& items, int64_t timestamp_ms) {
    TaskDescriptor descriptor;
    descriptor.set_task_id(task_id);
    descriptor.set_task_type(task_type);
    helpers::append_items(items, descriptor.mutable_items());
    descriptor.set_timestamp_ms(timestamp_ms);
    return descriptor;
}

std::string encode_task(const TaskDescriptor& descriptor) {
    std::string payload;
    if (!descriptor.SerializeToString(&payload)) {
        throw DecodeError("Failed to serialize task descriptor " + descriptor.task_id());
    }
    return payload;
}

TaskDescriptor decode_task(const std::string& payload) {
    TaskDescriptor descriptor;
    if (!descriptor.ParseFromString(payload)) {
        throw DecodeError("Malformed task descriptor");
    }
    if (descriptor.task_id().empty()) {
        throw DecodeError("Task descriptor has no task_id");
    }
    if (descriptor.task_type() != FETCH && descriptor.task_type() != RESTOCK) {
        throw DecodeError("Task descriptor " + descriptor.task_id() + " has no task_type");
    }
    return descriptor;
}

} // namespace grocery
