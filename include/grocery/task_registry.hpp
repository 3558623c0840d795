#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "grocery/common.pb.h"
#include "grocery/inventory.pb.h"
#include "types.hpp"

namespace grocery {

/**
 * What a task gathered by the time it was finalized.
 */
struct TaskOutcome {
    TaskType task_type = TASK_TYPE_UNSPECIFIED;
    std::vector<LineItem> items;
    std::vector<RobotTaskResult> results;
    int expected_responses = 0;
    bool all_responded = false;

    int responded() const { return static_cast<int>(results.size()); }
};

/**
 * Result of handing one robot response to the registry.
 */
struct RecordOutcome {
    /// false when the task is unknown, of another type, timed out, finalized or already complete
    bool recorded = false;
    /// true for exactly one response per task: the one that reached the expected count
    bool first_to_complete = false;
};

/**
 * In-flight tasks keyed by id, each with its own completion signal.
 *
 * One mutex guards the id counter, the map and every task's counters. A task
 * completes exactly once: when its response count reaches the expected count
 * before its deadline. Once complete, timed out or finalized it accepts no
 * more results, so a late robot can never re-open the barrier.
 *
 * Lifecycle per task:
 *   auto id = registry.next_task_id();
 *   registry.create(id, FETCH, items, deadline);
 *   // robots: registry.record_result(id, FETCH, result) from any thread
 *   bool all = registry.wait_for_completion(id);
 *   auto outcome = registry.finalize_and_remove(id);
 */
class TaskRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit TaskRegistry(int expected_responses);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Strictly increasing, starting at 1.
     */
    TaskId next_task_id();

    /**
     * Insert a task awaiting responses.
     *
     * @return false if the id is already registered
     */
    bool create(TaskId id, TaskType task_type, std::vector<LineItem> items, Clock::time_point deadline);

    /**
     * Append a robot's result and bump the response count.
     *
     * The completion check happens under the same lock as the increment, so
     * of two racing robots exactly one sees first_to_complete. Unknown,
     * finalized, timed-out and already-complete tasks record nothing, and
     * neither do results naming a different task type than the one created.
     */
    RecordOutcome record_result(TaskId id, TaskType task_type, const RobotTaskResult& result);

    /**
     * Block until every robot responded or the task's deadline passed.
     * On timeout the task stops accepting results before the lock is
     * released, so its outcome stays partial.
     *
     * @return true if all robots responded; false on timeout or unknown id
     */
    bool wait_for_completion(TaskId id);

    /**
     * Remove the task and hand back what it gathered. Later results for this
     * id are discarded.
     */
    std::optional<TaskOutcome> finalize_and_remove(TaskId id);

    bool contains(TaskId id) const;

    std::size_t size() const;

    int expected_responses() const { return expected_responses_; }

private:
    struct TaskState {
        TaskType task_type;
        std::vector<LineItem> items;
        Clock::time_point deadline;
        int response_count = 0;
        std::vector<RobotTaskResult> results;
        bool complete = false;
        bool timed_out = false;
        std::condition_variable done;
    };

    const int expected_responses_;
    mutable std::mutex mutex_;
    TaskId last_id_ = 0;
    std::unordered_map<TaskId, std::unique_ptr<TaskState>> tasks_;
};

} // namespace grocery
