#include "ui/console_presenter.hpp"
#include "ui/indicator_model.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace {

using Clock = IndicatorModel::Clock;
using Visual = IndicatorModel::Visual;
using std::chrono::milliseconds;

const Clock::time_point t0 = Clock::time_point() + std::chrono::hours(1);

} // namespace

TEST(IndicatorModelTest, StartsHidden) {
    IndicatorModel model;
    EXPECT_FALSE(model.visible());
    EXPECT_EQ(model.visual(), Visual::Hidden);
}

TEST(IndicatorModelTest, LoadingStaysUntilReplaced) {
    IndicatorModel model;
    model.apply(LifecycleEvent::modelLoading(), t0);

    EXPECT_FALSE(model.tick(t0 + std::chrono::hours(1)));
    EXPECT_EQ(model.visual(), Visual::Loading);
    EXPECT_TRUE(model.animating());
}

TEST(IndicatorModelTest, ReadyHidesAfterTwoSeconds) {
    IndicatorModel model;
    model.apply(LifecycleEvent::modelReady(), t0);

    EXPECT_FALSE(model.tick(t0 + milliseconds(1999)));
    EXPECT_EQ(model.visual(), Visual::Ready);
    EXPECT_TRUE(model.tick(t0 + milliseconds(2000)));
    EXPECT_FALSE(model.visible());
}

TEST(IndicatorModelTest, FailureHidesAfterFiveSecondsAndShowsReason) {
    IndicatorModel model;
    model.apply(LifecycleEvent::modelLoadFailed("no model"), t0);

    EXPECT_EQ(model.visual(), Visual::Failed);
    EXPECT_NE(model.caption().find("no model"), std::string::npos);
    EXPECT_FALSE(model.tick(t0 + milliseconds(4999)));
    EXPECT_TRUE(model.tick(t0 + milliseconds(5000)));
}

TEST(IndicatorModelTest, ListeningShowsLanguageUntilStopped) {
    IndicatorModel model;
    model.apply(LifecycleEvent::listeningStarted("AR"), t0);

    EXPECT_EQ(model.visual(), Visual::Listening);
    EXPECT_EQ(model.label(), "AR");
    EXPECT_FALSE(model.tick(t0 + std::chrono::minutes(5)));

    model.apply(LifecycleEvent::listeningStopped(), t0 + std::chrono::minutes(5));
    EXPECT_FALSE(model.visible());
}

TEST(IndicatorModelTest, StaleFlashHideDoesNotHideListening) {
    IndicatorModel model;
    model.apply(LifecycleEvent::languageSwitched("AR"), t0);
    model.apply(LifecycleEvent::listeningStarted("AR"), t0 + milliseconds(1000));

    EXPECT_FALSE(model.hidePending());
    EXPECT_FALSE(model.tick(t0 + milliseconds(1600)));
    EXPECT_EQ(model.visual(), Visual::Listening);
}

TEST(IndicatorModelTest, StaleReadyHideDoesNotHideLaterFlash) {
    IndicatorModel model;
    model.apply(LifecycleEvent::modelReady(), t0);
    model.apply(LifecycleEvent::languageSwitched("EN"), t0 + milliseconds(1900));

    // The ready deadline passes; only the flash deadline may hide.
    EXPECT_FALSE(model.tick(t0 + milliseconds(2100)));
    EXPECT_EQ(model.visual(), Visual::LanguageFlash);
    EXPECT_TRUE(model.tick(t0 + milliseconds(3400)));
}

TEST(IndicatorModelTest, RepeatedFlashRestartsTimer) {
    IndicatorModel model;
    model.apply(LifecycleEvent::languageSwitched("AR"), t0);
    model.apply(LifecycleEvent::languageSwitched("EN"), t0 + milliseconds(1000));

    EXPECT_FALSE(model.tick(t0 + milliseconds(1600)));
    EXPECT_EQ(model.label(), "EN");
    EXPECT_TRUE(model.tick(t0 + milliseconds(2500)));
}

TEST(IndicatorModelTest, EveryStateChangeBumpsGeneration) {
    IndicatorModel model;
    const unsigned g0 = model.generation();
    model.apply(LifecycleEvent::modelLoading(), t0);
    model.apply(LifecycleEvent::modelReady(), t0);
    EXPECT_EQ(model.generation(), g0 + 2);
}

TEST(ConsolePresenterTest, DrainsAllPendingEventsInOrder) {
    EventBus events;
    std::ostringstream out;
    ConsolePresenter presenter(events, out);

    events.push(LifecycleEvent::modelLoading());
    events.push(LifecycleEvent::modelReady());
    events.push(LifecycleEvent::listeningStarted("EN"));

    EXPECT_EQ(presenter.pollOnce(t0), 3);
    EXPECT_EQ(presenter.model().visual(), Visual::Listening);
    EXPECT_EQ(events.size(), 0u);
    EXPECT_NE(out.str().find("[EN]"), std::string::npos);
}

TEST(ConsolePresenterTest, IdlePollDoesNotRedraw) {
    EventBus events;
    std::ostringstream out;
    ConsolePresenter presenter(events, out);

    EXPECT_EQ(presenter.pollOnce(t0), 0);
    EXPECT_TRUE(out.str().empty());
}

TEST(ConsolePresenterTest, AutoHideHappensOnPoll) {
    EventBus events;
    std::ostringstream out;
    ConsolePresenter presenter(events, out);

    events.push(LifecycleEvent::modelReady());
    presenter.pollOnce(t0);
    EXPECT_TRUE(presenter.model().visible());

    presenter.pollOnce(t0 + milliseconds(2100));
    EXPECT_FALSE(presenter.model().visible());
}
