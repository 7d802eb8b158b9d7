#pragma once

#include <depth_stream_sync/dss_frame.h>
#include <depth_stream_sync/dss_message_channel.h>
#include <depth_stream_sync/dss_status_source.h>
#include <depth_stream_sync/dss_time.h>
#include <depth_stream_sync/dss_wire_codec.h>

#include <QByteArray>
#include <QStringList>
#include <QUrl>
#include <deque>
#include <memory>
#include <vector>

namespace dss_test {

// Clock the test advances by hand
class ManualClock : public dss::Clock {
public:
    double NowMs() const override { return m_now_ms; }
    void Set(double ms) { m_now_ms = ms; }
    void Advance(double ms) { m_now_ms += ms; }

private:
    double m_now_ms = 0.0;
};

// In-memory MessageChannel. Records what the transport does; the test
// drives inbound events by emitting the channel's signals.
class FakeChannel : public dss::MessageChannel {
    Q_OBJECT

public:
    explicit FakeChannel(QObject* parent = nullptr) : dss::MessageChannel(parent) {}

    void Open(const QUrl& url) override {
        ++open_count;
        last_url = url;
    }
    void Close() override { ++close_count; }

    bool SendText(const QString& message) override {
        if (!accept_sends) return false;
        sent.append(message);
        return true;
    }

    int open_count = 0;
    int close_count = 0;
    bool accept_sends = true;
    QUrl last_url;
    QStringList sent;
};

// StatusSource whose replies are delivered explicitly by the test
class ScriptedStatusSource : public dss::StatusSource {
public:
    void FetchStatus(Callback done) override {
        ++fetch_count;
        m_waiting.push_back(std::move(done));
    }

    bool HasPending() const { return !m_waiting.empty(); }
    size_t PendingCount() const { return m_waiting.size(); }

    void Deliver(dss::Result<dss::ServerStatus> result) {
        Callback done = std::move(m_waiting.front());
        m_waiting.pop_front();
        done(std::move(result));
    }

    int fetch_count = 0;

private:
    std::deque<Callback> m_waiting;
};

// LogSink that keeps every posted line
class RecordingLogSink : public dss::LogSink {
public:
    void PostLog(const QString& message) override { posted.append(message); }

    QStringList posted;
};

inline dss::DepthFrame::Header make_header(dss::TimeMs timestamp_ms, uint32_t width = 2,
                                           uint32_t height = 2) {
    dss::DepthFrame::Header header;
    header.timestamp_ms = timestamp_ms;
    header.width = width;
    header.height = height;
    header.scale = 0.5f;
    header.bias = 1.0f;
    header.z_max = 10.0f;
    return header;
}

// Samples 0, 1, 2, ... for a width x height frame
inline std::vector<uint16_t> ramp_samples(uint32_t width, uint32_t height) {
    std::vector<uint16_t> samples(static_cast<size_t>(width) * height);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<uint16_t>(i);
    }
    return samples;
}

inline QByteArray frame_bytes(dss::TimeMs timestamp_ms, bool compress = false,
                              uint32_t width = 2, uint32_t height = 2) {
    return dss::WireCodec::Encode(make_header(timestamp_ms, width, height),
                                  ramp_samples(width, height), compress);
}

// Decoded frame for buffer tests (no wire round trip)
inline dss::FramePtr make_frame(dss::TimeMs timestamp_ms, float z_max = 10.0f) {
    dss::DepthFrame::Header header = make_header(timestamp_ms, 1, 1);
    header.z_max = z_max;
    return std::make_shared<const dss::DepthFrame>(header, std::vector<float>{1.0f});
}

inline dss::ServerStatus status_with_workers(int workers) {
    dss::ServerStatus status;
    status.session_id = "test";
    status.config.inference_workers = workers;
    return status;
}

} // namespace dss_test
