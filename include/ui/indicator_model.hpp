#ifndef INDICATOR_MODEL_HPP
#define INDICATOR_MODEL_HPP

#include "app/lifecycle_event.hpp"

#include <chrono>
#include <string>

// Visual state of the floating indicator. Owned and driven by the UI thread
// only; apply() and tick() take the current time so tests can drive it.
class IndicatorModel {
public:
    using Clock = std::chrono::steady_clock;

    enum class Visual {
        Hidden,
        Loading,
        Ready,
        Failed,
        Listening,
        LanguageFlash
    };

    struct Timing {
        std::chrono::milliseconds ready{2000};
        std::chrono::milliseconds failed{5000};
        std::chrono::milliseconds languageFlash{1500};
    };

    IndicatorModel() = default;
    explicit IndicatorModel(Timing timing) : timing_(timing) {}

    void apply(const LifecycleEvent& event, Clock::time_point now);

    // Fires a due auto-hide. Returns true if the indicator was hidden.
    bool tick(Clock::time_point now);

    Visual visual() const { return visual_; }
    bool visible() const { return visual_ != Visual::Hidden; }
    bool animating() const { return visual_ == Visual::Loading || visual_ == Visual::Listening; }
    bool hidePending() const { return hide_.armed && hide_.generation == generation_; }

    const std::string& label() const { return label_; }
    const std::string& caption() const { return caption_; }

    // Bumped on every state change.
    unsigned generation() const { return generation_; }

private:
    struct PendingHide {
        bool armed = false;
        unsigned generation = 0;
        bool skipIfListening = false;
        Clock::time_point due;
    };

    void show(Visual visual, const std::string& label, const std::string& caption);
    void hide();
    void scheduleHide(Clock::time_point due, bool skipIfListening);

    Timing timing_;

    Visual visual_ = Visual::Hidden;
    std::string label_;
    std::string caption_;
    bool listening_ = false;

    unsigned generation_ = 0;
    PendingHide hide_;
};

const char* toString(IndicatorModel::Visual visual);

#endif
