#include <QtTest>
#include <cmath>
#include "interaction/PointerTracker.hpp"

using namespace smu;
using namespace std::chrono_literals;

namespace {
bool near(f32 a, f32 b) {
    return std::abs(a - b) < 1e-4f;
}
} // namespace

class TestPointerTracker : public QObject {
    Q_OBJECT

private slots:
    void testStartsCentred() {
        PointerTracker tracker;
        QCOMPARE(tracker.position().x, 0.5f);
        QCOMPARE(tracker.position().y, 0.5f);
        QCOMPARE(tracker.velocity().x, 0.0f);
        QCOMPARE(tracker.velocity().y, 0.0f);
    }

    void testFirstMoveLeavesVelocityAlone() {
        PointerTracker tracker;
        QVERIFY(tracker.onMove({0.9f, 0.1f}, TimePoint{} + 1s));
        QVERIFY(near(tracker.position().x, 0.9f));
        QVERIFY(near(tracker.position().y, 0.1f));
        QCOMPARE(tracker.velocity().x, 0.0f);
        QCOMPARE(tracker.velocity().y, 0.0f);
    }

    void testSmoothingAndOutlier() {
        PointerTracker tracker;
        const TimePoint t0 = TimePoint{} + 10s;

        QVERIFY(tracker.onMove({0.1f, 0.1f}, t0));

        // 0.1 units in 50 ms is 2 units/s, blended with factor 0.3
        QVERIFY(tracker.onMove({0.2f, 0.1f}, t0 + 50ms));
        QVERIFY(near(tracker.velocity().x, 0.6f));
        QVERIFY(near(tracker.velocity().y, 0.0f));

        // 150 ms gap exceeds the outlier bound: position moves, velocity holds
        QVERIFY(tracker.onMove({0.5f, 0.1f}, t0 + 200ms));
        QVERIFY(near(tracker.position().x, 0.5f));
        QVERIFY(near(tracker.velocity().x, 0.6f));
    }

    void testOutlierBoundIsInclusive() {
        PointerTracker tracker;
        const TimePoint t0 = TimePoint{} + 10s;
        QVERIFY(tracker.onMove({0.0f, 0.0f}, t0));
        QVERIFY(tracker.onMove({0.1f, 0.0f}, t0 + 100ms));
        // 1 unit/s * 0.3
        QVERIFY(near(tracker.velocity().x, 0.3f));
    }

    void testThrottleDropsMove() {
        PointerTracker tracker;
        const TimePoint t0 = TimePoint{} + 10s;
        QVERIFY(tracker.onMove({0.2f, 0.2f}, t0));
        QVERIFY(!tracker.onMove({0.8f, 0.8f}, t0 + 4ms));
        QVERIFY(near(tracker.position().x, 0.2f));
        QCOMPARE(tracker.velocity().x, 0.0f);

        // A dropped move does not restart the throttle window
        QVERIFY(!tracker.onMove({0.8f, 0.8f}, t0 + 7ms));
        QVERIFY(tracker.onMove({0.8f, 0.8f}, t0 + 9ms));
        QVERIFY(near(tracker.position().x, 0.8f));
    }

    void testPositionClamped() {
        PointerTracker tracker;
        QVERIFY(tracker.onMove({-0.5f, 1.7f}, TimePoint{} + 1s));
        QCOMPARE(tracker.position().x, 0.0f);
        QCOMPARE(tracker.position().y, 1.0f);

        auto v = PointerTracker::clampUnit({2.0f, 0.25f});
        QCOMPARE(v.x, 1.0f);
        QCOMPARE(v.y, 0.25f);
    }

    void testVelocityStaysBetweenPreviousAndInstant() {
        PointerTracker tracker;
        TimePoint t = TimePoint{} + 10s;
        const Vec2 path[] = {{0.1f, 0.9f},
                             {0.3f, 0.7f},
                             {0.35f, 0.2f},
                             {0.9f, 0.25f},
                             {0.6f, 0.6f},
                             {0.1f, 0.1f}};
        const std::chrono::milliseconds gaps[] = {20ms, 35ms, 10ms, 60ms, 90ms};

        QVERIFY(tracker.onMove(path[0], t));
        for (usize i = 1; i < std::size(path); ++i) {
            const auto gap = gaps[i - 1];
            const Vec2 before = tracker.velocity();
            const Vec2 from = tracker.position();
            t += gap;
            QVERIFY(tracker.onMove(path[i], t));

            const f32 seconds = std::chrono::duration<f32>(gap).count();
            const f32 instant = (path[i].x - from.x) / seconds;
            const f32 lo = std::min(before.x, instant) - 1e-4f;
            const f32 hi = std::max(before.x, instant) + 1e-4f;
            QVERIFY(tracker.velocity().x >= lo);
            QVERIFY(tracker.velocity().x <= hi);
        }
    }

    void testCustomSettings() {
        PointerTracker::Settings settings;
        settings.throttle = 0ms;
        settings.smoothing = 1.0f;
        settings.outlier = 1s;
        PointerTracker tracker(settings);

        const TimePoint t0 = TimePoint{} + 10s;
        QVERIFY(tracker.onMove({0.0f, 0.5f}, t0));
        QVERIFY(tracker.onMove({0.5f, 0.5f}, t0 + 500ms));
        // Factor 1 takes the instantaneous velocity as is
        QVERIFY(near(tracker.velocity().x, 1.0f));
    }

    void testResetAndResetVelocity() {
        PointerTracker tracker;
        const TimePoint t0 = TimePoint{} + 10s;
        QVERIFY(tracker.onMove({0.1f, 0.1f}, t0));
        QVERIFY(tracker.onMove({0.2f, 0.1f}, t0 + 50ms));
        QVERIFY(tracker.velocity().x > 0.0f);

        tracker.resetVelocity();
        QCOMPARE(tracker.velocity().x, 0.0f);
        QVERIFY(near(tracker.position().x, 0.2f));

        tracker.reset();
        QCOMPARE(tracker.position().x, 0.5f);
        // No previous move after a reset, so nothing is throttled
        QVERIFY(tracker.onMove({0.4f, 0.4f}, t0 + 51ms));
        QCOMPARE(tracker.velocity().x, 0.0f);
    }

    void testEnterSetsPositionOnly() {
        PointerTracker tracker;
        tracker.onEnter({0.3f, 0.7f});
        QVERIFY(near(tracker.position().x, 0.3f));
        QVERIFY(near(tracker.position().y, 0.7f));
        QCOMPARE(tracker.velocity().x, 0.0f);
    }
};

int runTestPointerTracker(int argc, char** argv) {
    TestPointerTracker t;
    return QTest::qExec(&t, argc, argv);
}

#include "test_PointerTracker.moc"
