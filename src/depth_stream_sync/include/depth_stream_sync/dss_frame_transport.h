#pragma once

#include "dss_frame.h"
#include "dss_link_estimators.h"
#include "dss_message_channel.h"
#include "dss_prefetch_scheduler.h"
#include "dss_request_tracker.h"
#include "dss_time.h"
#include "dss_wire_codec.h"

#include <QObject>
#include <QUrl>
#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

namespace dss {

struct TransportStats {
    int64_t requests_sent = 0;
    int64_t frames_received = 0;
    int64_t decode_failures = 0;
    int64_t server_errors = 0;
    int64_t pending_dropped = 0;
};

// Connection lifecycle, request/response correlation and link estimation
// for the depth stream.
//
// State machine (no automatic reconnect):
//   Disconnected -> Connecting -> Open -> Closed
//   Closed is reachable from any state on failure or explicit Close().
// All channel events are funnelled into handle_event() in arrival order.
//
// Invariant: inflight rises only when a request is actually transmitted and
// falls only on a terminal response or a connection reset.
class FrameTransport : public QObject, public FrameRequester {
    Q_OBJECT

public:
    enum class State { Disconnected, Connecting, Open, Closed };
    Q_ENUM(State)

    static constexpr size_t PENDING_CAPACITY = 60;

    // Takes ownership of channel. tracker must outlive the transport.
    FrameTransport(std::unique_ptr<MessageChannel> channel, RequestTracker& tracker,
                   const Clock& clock, QObject* parent = nullptr);
    ~FrameTransport() override;

    void Connect(const QUrl& url);

    // Drops the connection, the pending queue and all in-flight bookkeeping
    void Close();

    // Close() then Connect() to the last URL
    void Reconnect();

    // Queue a request for timestamp t; oldest entry is dropped past capacity
    void EnqueueRequest(TimeMs t);

    // FrameRequester
    double RoundTripMs() const override { return m_rtt.rtt_ms(); }
    int InflightCount() const override { return m_inflight; }
    void RequestFrame(TimeMs t) override { EnqueueRequest(t); }

    double JitterMs() const { return m_jitter.jitter_ms(); }
    State state() const { return m_state; }
    bool IsConnected() const { return m_state == State::Open; }
    QUrl url() const { return m_url; }

    std::vector<TimeMs> PendingSend() const { return {m_pending.begin(), m_pending.end()}; }

    WireCodec& codec() { return m_codec; }
    const WireCodec& codec() const { return m_codec; }
    const TransportStats& stats() const { return m_stats; }

signals:
    void frameReceived(const dss::FramePtr& frame);
    void stateChanged(dss::FrameTransport::State state);
    void connectedChanged(bool connected);
    void serverError(const QString& message);

private:
    struct ChannelEvent {
        enum class Kind { Opened, Closed, Failed, Text, Binary };
        Kind kind;
        QString text;
        QByteArray payload;
    };

    void handle_event(const ChannelEvent& event);
    void transition(State next);
    void flush_pending();
    void on_text(const QString& message);
    void on_binary(const QByteArray& payload);
    void on_connection_lost(const QString& reason);
    void decrement_inflight();

    MessageChannel* m_channel;   // owned (QObject child)
    RequestTracker& m_tracker;
    const Clock& m_clock;

    State m_state = State::Disconnected;
    QUrl m_url;
    int m_inflight = 0;
    std::deque<TimeMs> m_pending;

    WireCodec m_codec;
    RttEstimator m_rtt;
    JitterEstimator m_jitter;
    TransportStats m_stats;
};

const char* state_to_string(FrameTransport::State state);

} // namespace dss

Q_DECLARE_METATYPE(dss::FramePtr)
