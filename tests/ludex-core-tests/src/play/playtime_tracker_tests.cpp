#include <catch2/catch_test_macros.hpp>

#include <ludex/play/playtime_tracker.hpp>

#include <map>
#include <mutex>

namespace playtime_tracker {

using namespace std::chrono_literals;

// Reports every process alive for a fixed number of polls
struct CountdownWatcher : ludex::launch::ProcessWatcher {
    explicit CountdownWatcher(int polls)
        : polls(polls) {}

    bool IsAlive(ludex::launch::ProcessHandle &) override {
        std::unique_lock lock{mutex};
        ++calls;
        return calls <= polls;
    }

    std::mutex mutex;
    int polls;
    int calls = 0;
};

struct TestSubject {
    std::mutex mutex;
    std::map<ludex::Key, std::vector<double>> reports;

    ludex::play::PlaytimeTracker::ExitCallback Recorder() {
        return [this](const ludex::Key &key, double seconds) {
            std::unique_lock lock{mutex};
            reports[key].push_back(seconds);
        };
    }
};

TEST_CASE_METHOD(TestSubject, "Playtime is reported once when the process exits", "[play]") {
    CountdownWatcher watcher{3};
    ludex::play::PlaytimeTracker tracker{watcher, Recorder(), 1ms};

    const auto start = ludex::play::PlaytimeTracker::Clock::now() - 90s;
    tracker.Track(ludex::launch::ProcessHandle{}, "mario", start);
    tracker.WaitAll();

    CHECK(tracker.ActiveCount() == 0);
    CHECK(watcher.calls == 4);
    REQUIRE(reports["mario"].size() == 1);
    CHECK(reports["mario"][0] >= 90.0);
    CHECK(reports["mario"][0] < 3600.0);
}

TEST_CASE_METHOD(TestSubject, "Processes that are already gone report immediately", "[play]") {
    CountdownWatcher watcher{0};
    ludex::play::PlaytimeTracker tracker{watcher, Recorder(), 1h};

    tracker.Track(ludex::launch::ProcessHandle{}, "zelda");
    tracker.WaitAll();

    REQUIRE(reports["zelda"].size() == 1);
    CHECK(reports["zelda"][0] >= 0.0);
}

TEST_CASE_METHOD(TestSubject, "Concurrent launches are tracked independently", "[play]") {
    CountdownWatcher watcher{6};
    {
        ludex::play::PlaytimeTracker tracker{watcher, Recorder(), 1ms};
        tracker.Track(ludex::launch::ProcessHandle{}, "mario");
        tracker.Track(ludex::launch::ProcessHandle{}, "zelda");
        tracker.Track(ludex::launch::ProcessHandle{}, "mario");
        // Destruction waits for every tracked launch
    }

    CHECK(reports["mario"].size() == 2);
    CHECK(reports["zelda"].size() == 1);
}

} // namespace playtime_tracker
