#include "ui/indicator_model.hpp"

void IndicatorModel::show(Visual visual, const std::string& label, const std::string& caption) {
    visual_ = visual;
    label_ = label;
    caption_ = caption;
    ++generation_;
}

void IndicatorModel::hide() {
    visual_ = Visual::Hidden;
    caption_.clear();
    ++generation_;
}

// Only the most recent state may hide the indicator: the pending hide is
// tagged with the generation it was scheduled for.
void IndicatorModel::scheduleHide(Clock::time_point due, bool skipIfListening) {
    hide_.armed = true;
    hide_.generation = generation_;
    hide_.skipIfListening = skipIfListening;
    hide_.due = due;
}

void IndicatorModel::apply(const LifecycleEvent& event, Clock::time_point now) {
    switch (event.type) {
        case LifecycleEvent::Type::ModelLoading:
            show(Visual::Loading, "..", "Loading AI");
            break;

        case LifecycleEvent::Type::ModelReady:
            show(Visual::Ready, "OK", "Ready!");
            scheduleHide(now + timing_.ready, true);
            break;

        case LifecycleEvent::Type::ModelLoadFailed:
            show(Visual::Failed, "X", event.detail.empty() ? "Error!" : "Error! " + event.detail);
            scheduleHide(now + timing_.failed, false);
            break;

        case LifecycleEvent::Type::ListeningStarted:
            listening_ = true;
            show(Visual::Listening, event.detail, "");
            break;

        case LifecycleEvent::Type::ListeningStopped:
            listening_ = false;
            hide();
            break;

        case LifecycleEvent::Type::LanguageSwitched:
            show(Visual::LanguageFlash, event.detail, "");
            scheduleHide(now + timing_.languageFlash, true);
            break;
    }
}

bool IndicatorModel::tick(Clock::time_point now) {
    if (!hide_.armed || now < hide_.due) return false;

    hide_.armed = false;
    if (hide_.generation != generation_) return false;   // stale
    if (hide_.skipIfListening && listening_) return false;

    hide();
    return true;
}

const char* toString(IndicatorModel::Visual visual) {
    switch (visual) {
        case IndicatorModel::Visual::Hidden: return "hidden";
        case IndicatorModel::Visual::Loading: return "loading";
        case IndicatorModel::Visual::Ready: return "ready";
        case IndicatorModel::Visual::Failed: return "failed";
        case IndicatorModel::Visual::Listening: return "listening";
        case IndicatorModel::Visual::LanguageFlash: return "language";
    }
    return "unknown";
}
