#include "ui/console_presenter.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <thread>

namespace {

const std::chrono::milliseconds kPollInterval(100);
const std::chrono::milliseconds kAnimationTick(80);

const int kBars = 20;
const char kLevels[] = " .:-=+*#";

std::string waveform(unsigned frame, bool loading) {
    std::string bars;
    const double t = frame * (loading ? 0.15 : 0.4);
    for (int i = 0; i < kBars; ++i) {
        double h = loading ? std::sin(t * 2 - i * 0.35) * 0.5 + 0.5
                           : std::fabs(std::sin(t + i * 0.5));
        int level = (int)(h * 7.0 + 0.5);
        if (level < 0) level = 0;
        if (level > 7) level = 7;
        bars += kLevels[level];
    }
    return bars;
}

} // namespace

// Constructor
ConsolePresenter::ConsolePresenter(EventBus& events, std::ostream& out) : events_(events), out_(out) {}

int ConsolePresenter::pollOnce(IndicatorModel::Clock::time_point now) {
    const unsigned before = model_.generation();

    int drained = 0;
    LifecycleEvent event;
    while (events_.tryPop(event)) {
        model_.apply(event, now);
        ++drained;
    }
    model_.tick(now);

    if (model_.generation() != before || model_.animating()) {
        if (model_.animating()) ++frame_;
        redraw();
    }
    return drained;
}

void ConsolePresenter::run(const std::atomic<bool>& running) {
    while (running.load()) {
        pollOnce(IndicatorModel::Clock::now());
        std::this_thread::sleep_for(model_.animating() ? kAnimationTick : kPollInterval);
    }
    if (drawn_) out_ << std::endl;
}

void ConsolePresenter::redraw() {
    std::string line;
    switch (model_.visual()) {
        case IndicatorModel::Visual::Hidden:
            line = "";
            break;
        case IndicatorModel::Visual::Loading:
            line = "[" + model_.label() + "] " + waveform(frame_, true) + " " + model_.caption() +
                   std::string(frame_ / 4 % 4, '.');
            break;
        case IndicatorModel::Visual::Listening:
            line = "[" + model_.label() + "] " + waveform(frame_, false);
            break;
        case IndicatorModel::Visual::Ready:
        case IndicatorModel::Visual::Failed:
        case IndicatorModel::Visual::LanguageFlash:
            line = "[" + model_.label() + "] " + std::string(kBars, '_') + " " + model_.caption();
            break;
    }

    // Pad so a shorter line fully overwrites the previous one.
    line.resize(std::max<size_t>(line.size(), 72), ' ');
    out_ << '\r' << line << std::flush;
    drawn_ = true;
}
