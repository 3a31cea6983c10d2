// c++ headers ------------------------------------------
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// external headers -------------------------------------
#include <gtest/gtest.h>

// project headers --------------------------------------
#include "panelkit/disposable.h"

namespace panelkit {
namespace {

TEST(DisposeList, RunsCallbacksOnceInInsertionOrder) {
  DisposeList list;
  std::vector<int> order;
  list.Add([&]() { order.push_back(1); });
  list.Add([&]() { order.push_back(2); });
  list.Add([&]() { order.push_back(3); });

  list.Dispose();
  EXPECT_EQ(order, (std::vector<int>{ 1, 2, 3 }));
  EXPECT_TRUE(list.disposed());
  EXPECT_EQ(list.size(), 0u);
}

TEST(DisposeList, RemovedCallbackDoesNotRun) {
  DisposeList list;
  int calls = 0;
  DisposeList::Token const token = list.Add([&]() { ++calls; });
  list.Remove(token);
  list.Dispose();
  EXPECT_EQ(calls, 0);
}

TEST(DisposeList, ConsistencyErrorsThrow) {
  DisposeList list;
  DisposeList::Token const token = list.Add([]() {});
  list.Remove(token);
  EXPECT_THROW(list.Remove(token), std::logic_error);
  EXPECT_THROW(list.Add(nullptr), std::invalid_argument);

  list.Dispose();
  EXPECT_THROW(list.Dispose(), std::logic_error);
  EXPECT_THROW(list.Add([]() {}), std::logic_error);
}

struct Source {
  std::string name = "source";
};

class Recorder final : public IChangeListener<Source> {
public:
  Recorder(std::vector<std::string>& log, std::string tag) : log_(log), tag_(std::move(tag)) {}

  void OnChanged(Source const& source) override {
    log_.push_back(tag_ + ":" + source.name);
    if (on_changed) {
      on_changed();
    }
  }

  std::function<void()> on_changed;

private:
  std::vector<std::string>& log_;
  std::string tag_;
};

TEST(ChangeNotifier, DeliversInRegistrationOrder) {
  Source source;
  ChangeNotifier<Source> notifier(source);
  std::vector<std::string> log;
  Recorder a(log, "a");
  Recorder b(log, "b");

  notifier.AddListener(&b);
  notifier.AddListener(&a);
  notifier.Notify();

  EXPECT_EQ(log, (std::vector<std::string>{ "b:source", "a:source" }));
}

TEST(ChangeNotifier, RejectsDuplicatesAndUnknownListeners) {
  Source source;
  ChangeNotifier<Source> notifier(source);
  std::vector<std::string> log;
  Recorder a(log, "a");

  notifier.AddListener(&a);
  EXPECT_THROW(notifier.AddListener(&a), std::logic_error);
  EXPECT_THROW(notifier.AddListener(nullptr), std::invalid_argument);

  notifier.RemoveListener(&a);
  EXPECT_THROW(notifier.RemoveListener(&a), std::logic_error);
  EXPECT_EQ(notifier.listener_count(), 0u);
}

TEST(ChangeNotifier, ListenerRemovedDuringNotifyIsSkipped) {
  Source source;
  ChangeNotifier<Source> notifier(source);
  std::vector<std::string> log;
  Recorder a(log, "a");
  Recorder b(log, "b");
  Recorder c(log, "c");
  a.on_changed = [&]() {
    notifier.RemoveListener(&b);
    notifier.AddListener(&c);
  };

  notifier.AddListener(&a);
  notifier.AddListener(&b);
  notifier.Notify();
  EXPECT_EQ(log, (std::vector<std::string>{ "a:source" }));

  log.clear();
  a.on_changed = nullptr;
  notifier.Notify();
  EXPECT_EQ(log, (std::vector<std::string>{ "a:source", "c:source" }));
}

TEST(ChangeNotifier, RemoveAllListeners) {
  Source source;
  ChangeNotifier<Source> notifier(source);
  std::vector<std::string> log;
  Recorder a(log, "a");
  notifier.AddListener(&a);
  notifier.RemoveAllListeners();
  notifier.Notify();
  EXPECT_TRUE(log.empty());
}

} // namespace
} // namespace panelkit
