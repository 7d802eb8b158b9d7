// Unified request table: gap marks, transmit FIFO, invalidation

#include <QtTest>

#include <depth_stream_sync/dss_request_tracker.h>

class TestRequestTracker : public QObject
{
    Q_OBJECT

private slots:
    void test_mark_and_timeout() {
        dss::RequestTracker tracker;
        tracker.MarkRequested(100, 0.0);
        QVERIFY(tracker.IsAwaiting(100, 999.0, 1000.0));
        QVERIFY(!tracker.IsAwaiting(100, 1000.0, 1000.0));
        QVERIFY(!tracker.IsAwaiting(200, 0.0, 1000.0));
        QCOMPARE(tracker.RequestedCount(), size_t(1));
    }

    void test_duplicate_request_rtt_uses_first_send() {
        dss::RequestTracker tracker;
        tracker.RecordSend(500, 10.0);
        tracker.RecordSend(500, 60.0);
        QCOMPARE(tracker.OutstandingSends(), size_t(2));

        auto first = tracker.TakeRoundTrip(500, 110.0);
        QVERIFY(first.has_value());
        QCOMPARE(*first, 100.0);

        auto second = tracker.TakeRoundTrip(500, 160.0);
        QVERIFY(second.has_value());
        QCOMPARE(*second, 100.0);

        QVERIFY(!tracker.TakeRoundTrip(500, 200.0).has_value());
        QCOMPARE(tracker.size(), size_t(0));
    }

    void test_resolve_keeps_outstanding_sends() {
        dss::RequestTracker tracker;
        tracker.MarkRequested(33, 0.0);
        tracker.RecordSend(33, 1.0);
        tracker.Resolve(33);
        QVERIFY(!tracker.RequestedAt(33).has_value());
        QCOMPARE(tracker.size(), size_t(1));
        QVERIFY(tracker.TakeRoundTrip(33, 5.0).has_value());
        QCOMPARE(tracker.size(), size_t(0));
    }

    void test_discard_send_pops_oldest() {
        dss::RequestTracker tracker;
        tracker.RecordSend(66, 0.0);
        tracker.RecordSend(66, 40.0);
        tracker.DiscardSend(66);
        QCOMPARE(tracker.OutstandingSends(), size_t(1));
        QCOMPARE(tracker.TakeRoundTrip(66, 90.0).value_or(-1.0), 50.0);

        // Nothing to discard
        tracker.DiscardSend(66);
        QCOMPARE(tracker.size(), size_t(0));
    }

    void test_expire_sends_before_cutoff() {
        dss::RequestTracker tracker;
        tracker.MarkRequested(100, 0.0);
        tracker.RecordSend(100, 0.0);
        tracker.RecordSend(100, 500.0);
        tracker.RecordSend(100, 1200.0);

        tracker.ExpireSends(100, 500.0);
        QCOMPARE(tracker.OutstandingSends(), size_t(1));
        QCOMPARE(tracker.TakeRoundTrip(100, 1250.0).value_or(-1.0), 50.0);
        QVERIFY(tracker.RequestedAt(100).has_value());
    }

    void test_prune_before_cutoff() {
        dss::RequestTracker tracker;
        tracker.MarkRequested(0, 0.0);
        tracker.MarkRequested(500, 0.0);
        tracker.MarkRequested(1000, 0.0);
        tracker.PruneBefore(500);
        QVERIFY(!tracker.RequestedAt(0).has_value());
        QVERIFY(tracker.RequestedAt(500).has_value());
        QVERIFY(tracker.RequestedAt(1000).has_value());
    }

    void test_forget_sends_keeps_gap_marks() {
        dss::RequestTracker tracker;
        tracker.MarkRequested(100, 5.0);
        tracker.RecordSend(100, 6.0);
        tracker.RecordSend(200, 6.0);
        tracker.ForgetSends();
        QCOMPARE(tracker.OutstandingSends(), size_t(0));
        QCOMPARE(tracker.RequestedAt(100).value_or(-1.0), 5.0);
        QCOMPARE(tracker.size(), size_t(1));
    }
};

QTEST_MAIN(TestRequestTracker)
#include "test_request_tracker.moc"
