#include "grocery/task_registry.hpp"

#include <utility>

namespace grocery {

TaskRegistry::TaskRegistry(int expected_responses)
    : expected_responses_(expected_responses) {}

TaskId TaskRegistry::next_task_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++last_id_;
}

bool TaskRegistry::create(TaskId id, TaskType task_type, std::vector<LineItem> items,
                          Clock::time_point deadline) {
    auto state = std::make_unique<TaskState>();
    state->task_type = task_type;
    state->items = std::move(items);
    state->deadline = deadline;

    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.emplace(id, std::move(state)).second;
}

RecordOutcome TaskRegistry::record_result(TaskId id, TaskType task_type,
                                          const RobotTaskResult& result) {
    RecordOutcome outcome;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return outcome;

    auto& state = *it->second;
    if (state.complete || state.timed_out || state.task_type != task_type) return outcome;

    state.results.push_back(result);
    ++state.response_count;
    outcome.recorded = true;
    if (state.response_count < expected_responses_) return outcome;

    state.complete = true;
    state.done.notify_all();
    outcome.first_to_complete = true;
    return outcome;
}

bool TaskRegistry::wait_for_completion(TaskId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;

    // The waiting caller is the only one that finalizes, so the state
    // outlives this wait.
    TaskState* state = it->second.get();
    if (state->done.wait_until(lock, state->deadline, [state] { return state->complete; })) {
        return true;
    }
    state->timed_out = true;
    return false;
}

std::optional<TaskOutcome> TaskRegistry::finalize_and_remove(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;

    auto& state = *it->second;
    TaskOutcome outcome;
    outcome.task_type = state.task_type;
    outcome.items = std::move(state.items);
    outcome.results = std::move(state.results);
    outcome.expected_responses = expected_responses_;
    outcome.all_responded = state.complete;

    tasks_.erase(it);
    return outcome;
}

bool TaskRegistry::contains(TaskId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(id) > 0;
}

std::size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace grocery
