#include "events/EventManager.hpp"
#include "events/AppEvents.hpp"
#include "utils/AnimationClock.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

class RecordingHandler : public IEventHandler {
public:
  void onEvent(const EventPtr& event) override { names.push_back(event->name()); }
  std::vector<std::string> names;
};

class ThrowingHandler : public IEventHandler {
public:
  void onEvent(const EventPtr&) override { throw std::runtime_error("boom"); }
};

// Queues a follow-up event while handling the first one.
class ChainingHandler : public IEventHandler {
public:
  explicit ChainingHandler(EventManager& em) : em(em) {}
  void onEvent(const EventPtr& event) override
  {
    if (std::dynamic_pointer_cast<PauseAnimationEvent>(event)) {
      em.queue(make_event<ResetAnimationEvent>());
    }
  }

private:
  EventManager& em;
};

class SelfRemovingHandler : public IEventHandler {
public:
  explicit SelfRemovingHandler(EventManager& em) : em(em) {}
  void onEvent(const EventPtr&) override
  {
    ++calls;
    em.unsubscribe(this);
  }
  int calls = 0;

private:
  EventManager& em;
};

static void TestSubscribeAndPublish()
{
  EventManager em;
  RecordingHandler a;
  RecordingHandler b;
  em.subscribe(&a);
  em.subscribe(&a);
  em.subscribe(&b);
  em.subscribe(nullptr);
  EXPECT_EQ(em.handlerCount(), static_cast<std::size_t>(2));

  em.publish(make_event<CloseWindowEvent>());
  EXPECT_EQ(a.names.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(b.names.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(a.names[0], std::string("CloseWindowEvent"));

  em.unsubscribe(&a);
  em.publish(make_event<ToggleFullscreenEvent>());
  EXPECT_EQ(a.names.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(b.names.size(), static_cast<std::size_t>(2));

  // null events are dropped
  em.publish(nullptr);
  EXPECT_EQ(b.names.size(), static_cast<std::size_t>(2));
}

static void TestQueueIsFifoAndDeferred()
{
  EventManager em;
  RecordingHandler h;
  em.subscribe(&h);

  em.queue(make_event<PauseAnimationEvent>());
  em.queue(make_event<ResetAnimationEvent>());
  em.queue(nullptr);
  EXPECT_EQ(em.queuedCount(), static_cast<std::size_t>(2));
  EXPECT_TRUE(h.names.empty());

  EXPECT_EQ(em.processQueued(), static_cast<std::size_t>(2));
  EXPECT_EQ(em.queuedCount(), static_cast<std::size_t>(0));
  const std::vector<std::string> expected = {"PauseAnimationEvent", "ResetAnimationEvent"};
  EXPECT_TRUE(h.names == expected);

  EXPECT_EQ(em.processQueued(), static_cast<std::size_t>(0));
}

static void TestEventsQueuedDuringDispatchWait()
{
  EventManager em;
  ChainingHandler chain(em);
  RecordingHandler h;
  em.subscribe(&chain);
  em.subscribe(&h);

  em.queue(make_event<PauseAnimationEvent>());
  EXPECT_EQ(em.processQueued(), static_cast<std::size_t>(1));
  EXPECT_EQ(h.names.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(em.queuedCount(), static_cast<std::size_t>(1));

  EXPECT_EQ(em.processQueued(), static_cast<std::size_t>(1));
  EXPECT_EQ(h.names.back(), std::string("ResetAnimationEvent"));
}

static void TestThrowingHandlerDoesNotStopOthers()
{
  EventManager em;
  ThrowingHandler bad;
  RecordingHandler good;
  em.subscribe(&bad);
  em.subscribe(&good);

  em.publish(make_event<CloseWindowEvent>());
  EXPECT_EQ(good.names.size(), static_cast<std::size_t>(1));
}

static void TestUnsubscribeDuringDispatch()
{
  EventManager em;
  SelfRemovingHandler once(em);
  RecordingHandler h;
  em.subscribe(&once);
  em.subscribe(&h);

  em.publish(make_event<CloseWindowEvent>());
  em.publish(make_event<CloseWindowEvent>());
  EXPECT_EQ(once.calls, 1);
  EXPECT_EQ(h.names.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(em.handlerCount(), static_cast<std::size_t>(1));
}

static void TestClockAdvance()
{
  AnimationClock clock;
  EXPECT_EQ(clock.elapsed(), 0.0);
  EXPECT_FALSE(clock.isPaused());

  clock.advance(0.25);
  clock.advance(0.5);
  EXPECT_NEAR(clock.elapsed(), 0.75, 1e-12);

  // negative and zero deltas are ignored
  clock.advance(-1.0);
  clock.advance(0.0);
  EXPECT_NEAR(clock.elapsed(), 0.75, 1e-12);
}

static void TestClockPauseAndReset()
{
  AnimationClock clock;
  clock.advance(1.0);
  clock.setPaused(true);
  clock.advance(5.0);
  EXPECT_NEAR(clock.elapsed(), 1.0, 1e-12);

  // resuming continues from the frozen time
  clock.togglePaused();
  EXPECT_FALSE(clock.isPaused());
  clock.advance(0.5);
  EXPECT_NEAR(clock.elapsed(), 1.5, 1e-12);

  clock.togglePaused();
  clock.reset();
  EXPECT_EQ(clock.elapsed(), 0.0);
  // reset does not change the pause state
  EXPECT_TRUE(clock.isPaused());
}

int main()
{
  TestSubscribeAndPublish();
  TestQueueIsFifoAndDeferred();
  TestEventsQueuedDuringDispatchWait();
  TestThrowingHandlerDoesNotStopOthers();
  TestUnsubscribeDuringDispatch();
  TestClockAdvance();
  TestClockPauseAndReset();

  if (g_failures == 0) {
    std::cout << "painter_house_events_tests: OK\n";
    return 0;
  }

  std::cerr << "painter_house_events_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
