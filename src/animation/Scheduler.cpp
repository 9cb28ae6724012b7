#include "animation/Scheduler.h"

#include <algorithm>
#include <vector>

namespace clustermap {

Scheduler& Scheduler::instance() {
    static Scheduler inst;
    return inst;
}

TaskHandle Scheduler::schedule(ScheduledTask task) {
    TaskHandle handle = nextHandle_++;
    queue_.push_back(Entry{handle, std::move(task)});
    return handle;
}

std::list<Scheduler::Entry>::iterator Scheduler::find(TaskHandle handle) {
    return std::find_if(queue_.begin(), queue_.end(),
                        [handle](const Entry& e) { return e.handle == handle; });
}

void Scheduler::cancel(TaskHandle handle) {
    auto it = find(handle);
    if (it != queue_.end()) {
        queue_.erase(it);
    }
}

bool Scheduler::isScheduled(TaskHandle handle) const {
    return std::any_of(queue_.begin(), queue_.end(),
                       [handle](const Entry& e) { return e.handle == handle; });
}

bool Scheduler::iteration(double now) {
    // Snapshot the handles so tasks can cancel or schedule freely
    std::vector<TaskHandle> handles;
    handles.reserve(queue_.size());
    for (const auto& e : queue_) {
        handles.push_back(e.handle);
    }

    for (TaskHandle handle : handles) {
        auto it = find(handle);
        if (it == queue_.end()) {
            continue;  // Cancelled by an earlier task
        }

        // Copy: the task may cancel itself while running
        ScheduledTask task = it->task;
        bool keep = task ? task(now) : false;

        if (!keep) {
            cancel(handle);
        }
    }

    return !queue_.empty();
}

} // namespace clustermap
