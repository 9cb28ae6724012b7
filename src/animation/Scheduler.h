#pragma once

#include <cstdint>
#include <functional>
#include <list>

namespace clustermap {

// Per-frame task. Receives the frame time in seconds; returns true to run
// again on the next frame, false to retire.
using ScheduledTask = std::function<bool(double now)>;

// 0 is never handed out
using TaskHandle = uint64_t;

class Scheduler {
public:
    Scheduler() = default;

    // Process-wide scheduler used by the UI layer
    static Scheduler& instance();

    TaskHandle schedule(ScheduledTask task);

    // Remove a task. Unknown or retired handles are ignored.
    void cancel(TaskHandle handle);

    bool isScheduled(TaskHandle handle) const;

    // Run every task once. Returns true if any task is still pending.
    // Tasks scheduled during the pass first run on the next pass.
    bool iteration(double now);

    bool hasPending() const { return !queue_.empty(); }
    size_t pendingCount() const { return queue_.size(); }

    void clear() { queue_.clear(); }

private:
    struct Entry {
        TaskHandle handle;
        ScheduledTask task;
    };

    std::list<Entry>::iterator find(TaskHandle handle);

    std::list<Entry> queue_;
    TaskHandle nextHandle_ = 1;
};

} // namespace clustermap
