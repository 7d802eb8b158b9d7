// Lead/timeout policy, window alignment and slot limiting

#include <QtTest>

#include <depth_stream_sync/dss_prefetch_scheduler.h>
#include "../common/dss_test_support.h"

namespace {

class RecordingRequester : public dss::FrameRequester {
public:
    double RoundTripMs() const override { return rtt_ms; }
    int InflightCount() const override { return inflight; }
    void RequestFrame(dss::TimeMs t) override { requested.push_back(t); }

    double rtt_ms = 0.0;
    int inflight = 0;
    std::vector<dss::TimeMs> requested;
};

dss::TuningSnapshot manual_lead(int lead_ms, int max_inflight = 8) {
    dss::TuningSnapshot tuning;
    tuning.lead_time_ms = lead_ms;
    tuning.max_inflight_requests = max_inflight;
    tuning.auto_lead_enabled = false;
    return tuning;
}

} // namespace

class TestPrefetchScheduler : public QObject
{
    Q_OBJECT

private slots:
    // ========================================================================
    // POLICY
    // ========================================================================

    void test_manual_lead_uses_configured_value() {
        QCOMPARE(dss::PrefetchScheduler::ComputeLeadMs(400.0, manual_lead(750)), 750.0);
    }

    void test_auto_lead_tracks_rtt() {
        dss::TuningSnapshot tuning;
        tuning.auto_lead_enabled = true;
        QCOMPARE(dss::PrefetchScheduler::ComputeLeadMs(0.0, tuning), 100.0);
        QCOMPARE(dss::PrefetchScheduler::ComputeLeadMs(50.0, tuning), 150.0);
        QCOMPARE(dss::PrefetchScheduler::ComputeLeadMs(400.0, tuning), 500.0);
        QCOMPARE(dss::PrefetchScheduler::ComputeLeadMs(5000.0, tuning), 3000.0);
    }

    void test_timeout_floor_and_scaling() {
        QCOMPARE(dss::PrefetchScheduler::ComputeTimeoutMs(0.0), 1000.0);
        QCOMPARE(dss::PrefetchScheduler::ComputeTimeoutMs(200.0), 1000.0);
        QCOMPARE(dss::PrefetchScheduler::ComputeTimeoutMs(400.0), 1300.0);
    }

    // ========================================================================
    // TICK
    // ========================================================================

    void test_tick_fills_free_slots() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);   // 50ms grid

        dss::TickReport report = scheduler.Tick(0.0, manual_lead(2000));
        QCOMPARE(report.window_start_ms, 2000.0);
        QCOMPARE(report.window_end_ms, 5000.0);
        QCOMPARE(report.available_slots, 8);
        QVERIFY(!report.throttled);
        QCOMPARE(requester.requested,
                 (std::vector<dss::TimeMs>{2000, 2050, 2100, 2150, 2200, 2250, 2300, 2350}));
        QCOMPARE(report.issued, requester.requested);
    }

    void test_window_start_aligned_to_grid() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        dss::TickReport report = scheduler.Tick(1010.0, manual_lead(100, 1));
        QCOMPARE(report.window_start_ms, 1150.0);
        QCOMPARE(requester.requested, (std::vector<dss::TimeMs>{1150}));
    }

    void test_negative_start_clamped_to_zero() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        dss::TickReport report = scheduler.Tick(-5000.0, manual_lead(2000, 1));
        QCOMPARE(report.window_start_ms, 0.0);
        QCOMPARE(requester.requested, (std::vector<dss::TimeMs>{0}));
    }

    void test_no_free_slots_throttles() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        requester.inflight = 8;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        dss::TickReport report = scheduler.Tick(0.0, manual_lead(2000));
        QVERIFY(report.throttled);
        QCOMPARE(report.available_slots, 0);
        QVERIFY(requester.requested.empty());
        QCOMPARE(buffer.requested_size(), size_t(0));
    }

    void test_partial_slots_mark_only_issued_points() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        requester.inflight = 5;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        scheduler.Tick(0.0, manual_lead(2000));
        QCOMPARE(requester.requested.size(), size_t(3));
        QCOMPARE(buffer.requested_size(), size_t(3));
    }

    void test_next_tick_does_not_repeat_awaiting_points() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        scheduler.Tick(0.0, manual_lead(2000, 2));
        clock.Advance(16.0);
        scheduler.Tick(16.0, manual_lead(2000, 4));
        QCOMPARE(requester.requested, (std::vector<dss::TimeMs>{2000, 2050, 2100, 2150, 2200, 2250}));
    }

    void test_tuning_change_applies_next_tick() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        dss::TickReport first = scheduler.Tick(0.0, manual_lead(2000, 1));
        dss::TickReport second = scheduler.Tick(0.0, manual_lead(500, 1));
        QCOMPARE(first.window_start_ms, 2000.0);
        QCOMPARE(second.window_start_ms, 500.0);
        QCOMPARE(requester.requested, (std::vector<dss::TimeMs>{2000, 500}));
    }

    void test_tick_expires_stale_marks() {
        dss_test::ManualClock clock;
        dss::JitterBuffer buffer(clock);
        RecordingRequester requester;
        dss::PrefetchScheduler scheduler(buffer, requester, 20.0);

        scheduler.Tick(0.0, manual_lead(0, 1));
        QVERIFY(buffer.tracker().RequestedAt(0).has_value());
        requester.inflight = 8;
        scheduler.Tick(5000.0, manual_lead(0, 8));
        QVERIFY(!buffer.tracker().RequestedAt(0).has_value());
    }
};

QTEST_MAIN(TestPrefetchScheduler)
#include "test_prefetch_scheduler.moc"
