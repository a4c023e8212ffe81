#ifndef CONSOLE_PRESENTER_HPP
#define CONSOLE_PRESENTER_HPP

#include "app/lifecycle_event.hpp"
#include "ui/indicator_model.hpp"

#include <atomic>
#include <chrono>
#include <ostream>

// Terminal rendition of the indicator: a single status line redrawn in place.
// run() is the UI loop; it is the only consumer of the event bus.
class ConsolePresenter {
public:
    ConsolePresenter(EventBus& events, std::ostream& out);

    // Drains every pending event, fires due hides and redraws if anything
    // changed or an animation is running. Returns the number of events drained.
    int pollOnce(IndicatorModel::Clock::time_point now);

    // Polls every 100 ms, every 80 ms while an animation is running.
    void run(const std::atomic<bool>& running);

    const IndicatorModel& model() const { return model_; }

private:
    void redraw();

    EventBus& events_;
    std::ostream& out_;
    IndicatorModel model_;

    unsigned frame_ = 0;
    bool drawn_ = false;
};

#endif
