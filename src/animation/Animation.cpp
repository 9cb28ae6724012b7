#include "animation/Animation.h"

namespace clustermap {

Animation::Animation(Scheduler& scheduler)
    : scheduler_(scheduler) {}

Animation& Animation::instance() {
    static Animation inst(Scheduler::instance());
    return inst;
}

void Animation::init() {
    active_ = false;
    needRedraw_ = true;
    framerate_ = 0.0f;
    frameTimes_.clear();
}

void Animation::framerateIteration(bool frameRendered, double now) {
    if (!frameRendered) {
        // Entering steady state; idle gaps must not count as frame time
        frameTimes_.clear();
        return;
    }

    frameTimes_.push_back(now);
    while (frameTimes_.size() > 2 &&
           now - frameTimes_.front() > FRAMERATE_AVERAGE_TIME) {
        frameTimes_.pop_front();
    }

    if (frameTimes_.size() >= 2) {
        double span = frameTimes_.back() - frameTimes_.front();
        if (span > 0.0) {
            framerate_ = static_cast<float>(
                static_cast<double>(frameTimes_.size() - 1) / span);
        }
    }
}

void Animation::tick(double now) {
    bool tasksPending = false;
    if (scheduler_.hasPending()) {
        // Scheduled tasks (zoom, pulse) run every frame they are alive
        tasksPending = scheduler_.iteration(now);
        needRedraw_ = true;
    }

    if (needRedraw_) {
        active_ = true;
        framerateIteration(true, now);
    } else if (!tasksPending && active_) {
        framerateIteration(false, now);
        active_ = false;
    }
}

void Animation::requestRedraw() {
    active_ = true;
    needRedraw_ = true;
}

} // namespace clustermap
