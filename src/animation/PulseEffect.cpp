#include "animation/PulseEffect.h"
#include "core/Types.h"

#include <cmath>

namespace clustermap {

double PulseEffect::weightAt(double t) {
    double phase = std::fmod(t, PERIOD);
    if (phase < 0.0) {
        phase += PERIOD;
    }
    return 0.5 * (1.0 - std::cos(2.0 * PI * phase / PERIOD));
}

double PulseEffect::scaleAt(double t) {
    return 1.05 + 0.30 * weightAt(t);
}

double PulseEffect::alphaAt(double t) {
    return 0.55 - 0.40 * weightAt(t);
}

PulseEffect::PulseEffect(Scheduler& scheduler)
    : scheduler_(scheduler) {}

PulseEffect::~PulseEffect() {
    setRunning(false);
}

bool PulseEffect::isRunning() const {
    return task_ != 0 && scheduler_.isScheduled(task_);
}

void PulseEffect::setRunning(bool running) {
    if (running == isRunning()) {
        return;
    }

    if (!running) {
        scheduler_.cancel(task_);
        task_ = 0;
        return;
    }

    task_ = scheduler_.schedule([this](double /*now*/) {
        if (redrawCb_) {
            redrawCb_();
        }
        return true;
    });
}

} // namespace clustermap
