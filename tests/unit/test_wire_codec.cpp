// Wire format decoding: tags, version policy, size checks, ordering guard

#include <QtTest>
#include <QtEndian>

#include <depth_stream_sync/dss_wire_codec.h>
#include "../common/dss_test_support.h"

using dss_test::frame_bytes;

class TestWireCodec : public QObject
{
    Q_OBJECT

private slots:
    // ========================================================================
    // HAPPY PATH
    // ========================================================================

    void test_decode_raw_frame() {
        dss::WireCodec codec;
        auto result = codec.Decode(frame_bytes(1000));
        QVERIFY(result.is_ok());

        const dss::FramePtr& frame = result.value();
        QCOMPARE(frame->timestamp_ms(), dss::TimeMs(1000));
        QCOMPARE(frame->width(), 2u);
        QCOMPARE(frame->height(), 2u);
        QCOMPARE(frame->z_max(), 10.0f);
        QVERIFY(!frame->compressed());

        // depth = sample * 0.5 + 1.0
        QCOMPARE(frame->at(0, 0), 1.0f);
        QCOMPARE(frame->at(1, 0), 1.5f);
        QCOMPARE(frame->at(0, 1), 2.0f);
        QCOMPARE(frame->at(1, 1), 2.5f);
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(1000));
        QCOMPARE(codec.stats().decoded, int64_t(1));
    }

    void test_decode_compressed_frame() {
        dss::WireCodec codec;
        auto result = codec.Decode(frame_bytes(40, true, 16, 8));
        QVERIFY(result.is_ok());

        const dss::FramePtr& frame = result.value();
        QVERIFY(frame->compressed());
        QCOMPARE(frame->samples().size(), size_t(16 * 8));
        QCOMPARE(frame->samples().back(), 127.0f * 0.5f + 1.0f);
    }

    // ========================================================================
    // REJECTIONS
    // ========================================================================

    void test_short_message_is_malformed() {
        dss::WireCodec codec;
        auto result = codec.Decode(QByteArray("VDZ1", 4));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::Malformed);
        QCOMPARE(codec.stats().malformed, int64_t(1));
    }

    void test_unknown_tag_rejected() {
        dss::WireCodec codec;
        QByteArray bytes = frame_bytes(0);
        bytes[3] = '9';
        auto result = codec.Decode(bytes);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::UnknownFormat);
        QCOMPARE(codec.stats().unknown_tag, int64_t(1));
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(-1));
    }

    void test_unsupported_version_rejected() {
        dss::DepthFrame::Header header = dss_test::make_header(0);
        header.version = 2;
        dss::WireCodec codec;
        auto result = codec.Decode(dss::WireCodec::Encode(header, dss_test::ramp_samples(2, 2), false));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::VersionMismatch);
        QCOMPARE(codec.stats().version_rejected, int64_t(1));
    }

    void test_zero_dimensions_rejected() {
        dss::WireCodec codec;
        auto result = codec.Decode(dss::WireCodec::Encode(dss_test::make_header(0, 0, 4), {}, false));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::Malformed);
    }

    void test_truncated_payload_rejected() {
        dss::WireCodec codec;
        QByteArray bytes = frame_bytes(0);
        bytes.chop(2);
        auto result = codec.Decode(bytes);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::Malformed);
    }

    void test_corrupt_compressed_payload_rejected() {
        dss::WireCodec codec;
        QByteArray bytes = frame_bytes(0, true).left(dss::wire::HEADER_SIZE);
        bytes.append("definitely not a zlib stream");
        auto result = codec.Decode(bytes);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::DecompressFailed);
        QCOMPARE(codec.stats().decompress_failed, int64_t(1));
        QCOMPARE(codec.stats().decoded, int64_t(0));
    }

    void test_oversized_compressed_stream_rejected() {
        // 2x2 header carrying a 64x64 zlib stream
        QByteArray bytes = frame_bytes(0, true).left(dss::wire::HEADER_SIZE);
        bytes.append(frame_bytes(0, true, 64, 64).mid(dss::wire::HEADER_SIZE));
        dss::WireCodec codec;
        auto result = codec.Decode(bytes);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::DecompressFailed);
    }

    void test_short_compressed_stream_rejected() {
        QByteArray bytes = frame_bytes(0, true, 2, 2).left(dss::wire::HEADER_SIZE);
        bytes.append(frame_bytes(0, true, 1, 1).mid(dss::wire::HEADER_SIZE));
        dss::WireCodec codec;
        auto result = codec.Decode(bytes);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dss::ErrorCode::Malformed);
    }

    void test_rejection_reports_header_timestamp() {
        dss::WireCodec codec;
        QByteArray bytes = frame_bytes(700);
        bytes.chop(1);
        QVERIFY(codec.Decode(bytes).is_error());
        QCOMPARE(codec.rejected_timestamp().value_or(-1), dss::TimeMs(700));

        QVERIFY(codec.Decode(QByteArray("XXXX", 4)).is_error());
        QVERIFY(!codec.rejected_timestamp().has_value());

        QVERIFY(codec.Decode(frame_bytes(800)).is_ok());
        QVERIFY(!codec.rejected_timestamp().has_value());
    }

    // ========================================================================
    // ORDERING GUARD
    // ========================================================================

    void test_late_frame_rejected_then_seek_accepted() {
        dss::WireCodec codec;
        QVERIFY(codec.Decode(frame_bytes(1000)).is_ok());

        // 100ms behind: late, not a seek
        auto late = codec.Decode(frame_bytes(900));
        QVERIFY(late.is_error());
        QCOMPARE(late.error().code, dss::ErrorCode::OutOfOrder);
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(1000));

        // 800ms behind: a seek
        auto seek = codec.Decode(frame_bytes(200));
        QVERIFY(seek.is_ok());
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(200));
        QCOMPARE(codec.stats().out_of_order, int64_t(1));
        QCOMPARE(codec.stats().seeks, int64_t(1));
    }

    void test_repeated_timestamp_accepted() {
        dss::WireCodec codec;
        QVERIFY(codec.Decode(frame_bytes(500)).is_ok());
        QVERIFY(codec.Decode(frame_bytes(500)).is_ok());
    }

    void test_reset_clears_cursor() {
        dss::WireCodec codec;
        QVERIFY(codec.Decode(frame_bytes(1000)).is_ok());
        codec.Reset();
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(-1));
        QVERIFY(codec.Decode(frame_bytes(900)).is_ok());
        QCOMPARE(codec.stats().seeks, int64_t(0));
    }

    void test_rejected_frame_does_not_move_cursor() {
        dss::WireCodec codec;
        QVERIFY(codec.Decode(frame_bytes(1000)).is_ok());
        QByteArray bytes = frame_bytes(2000);
        bytes.chop(1);
        QVERIFY(codec.Decode(bytes).is_error());
        QCOMPARE(codec.last_timestamp(), dss::TimeMs(1000));
    }
};

QTEST_MAIN(TestWireCodec)
#include "test_wire_codec.moc"
