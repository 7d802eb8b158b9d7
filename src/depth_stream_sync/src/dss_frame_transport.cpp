#include <depth_stream_sync/dss_frame_transport.h>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(dssTransport, "dss.transport")

namespace dss {

const char* state_to_string(FrameTransport::State state) {
    switch (state) {
        case FrameTransport::State::Disconnected: return "Disconnected";
        case FrameTransport::State::Connecting:   return "Connecting";
        case FrameTransport::State::Open:         return "Open";
        case FrameTransport::State::Closed:       return "Closed";
    }
    return "Unknown";
}

FrameTransport::FrameTransport(std::unique_ptr<MessageChannel> channel, RequestTracker& tracker,
                               const Clock& clock, QObject* parent)
    : QObject(parent)
    , m_channel(channel.release())
    , m_tracker(tracker)
    , m_clock(clock) {
    m_channel->setParent(this);

    using Kind = ChannelEvent::Kind;
    connect(m_channel, &MessageChannel::opened, this, [this]() {
        handle_event({Kind::Opened, {}, {}});
    });
    connect(m_channel, &MessageChannel::closed, this, [this]() {
        handle_event({Kind::Closed, {}, {}});
    });
    connect(m_channel, &MessageChannel::failed, this, [this](const QString& reason) {
        handle_event({Kind::Failed, reason, {}});
    });
    connect(m_channel, &MessageChannel::textReceived, this, [this](const QString& text) {
        handle_event({Kind::Text, text, {}});
    });
    connect(m_channel, &MessageChannel::binaryReceived, this, [this](const QByteArray& payload) {
        handle_event({Kind::Binary, {}, payload});
    });
}

FrameTransport::~FrameTransport() {
    m_channel->disconnect(this);
    m_channel->Close();
}

// ============================================================================
// Lifecycle
// ============================================================================

void FrameTransport::Connect(const QUrl& url) {
    if (m_state == State::Connecting || m_state == State::Open) {
        qCWarning(dssTransport, "Connect ignored: already %s", state_to_string(m_state));
        return;
    }
    m_url = url;
    transition(State::Connecting);
    m_channel->Open(url);
}

void FrameTransport::Close() {
    m_channel->Close();
    m_pending.clear();
    m_inflight = 0;
    m_tracker.ForgetSends();
    if (m_state != State::Closed) {
        transition(State::Closed);
    }
}

void FrameTransport::Reconnect() {
    if (m_url.isEmpty()) {
        qCWarning(dssTransport, "Reconnect requested before any Connect");
        return;
    }
    Close();
    Connect(m_url);
}

void FrameTransport::transition(State next) {
    if (next == m_state) return;
    const bool was_open = (m_state == State::Open);
    qCDebug(dssTransport, "%s -> %s", state_to_string(m_state), state_to_string(next));
    m_state = next;
    emit stateChanged(next);
    if (was_open != (next == State::Open)) {
        emit connectedChanged(next == State::Open);
    }
}

// ============================================================================
// Event dispatch
// ============================================================================

void FrameTransport::handle_event(const ChannelEvent& event) {
    using Kind = ChannelEvent::Kind;
    switch (event.kind) {
        case Kind::Opened:
            if (m_state != State::Connecting) return;
            qCInfo(dssTransport, "Depth stream open: %s", qPrintable(m_url.toString()));
            transition(State::Open);
            flush_pending();
            return;

        case Kind::Closed:
        case Kind::Failed:
            if (m_state != State::Connecting && m_state != State::Open) return;
            on_connection_lost(event.kind == Kind::Failed ? event.text : QStringLiteral("closed by peer"));
            return;

        case Kind::Text:
            if (m_state != State::Open) return;
            on_text(event.text);
            return;

        case Kind::Binary:
            if (m_state != State::Open) return;
            on_binary(event.payload);
            return;
    }
}

void FrameTransport::on_connection_lost(const QString& reason) {
    // Whatever was in flight is gone; the scheduler re-requests the gaps
    qCWarning(dssTransport, "Depth stream lost (%s), %d request(s) in flight dropped",
              qPrintable(reason), m_inflight);
    m_inflight = 0;
    m_tracker.ForgetSends();
    transition(State::Closed);
}

void FrameTransport::on_text(const QString& message) {
    decrement_inflight();

    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCDebug(dssTransport, "Unparseable control message: %s", qPrintable(parse_error.errorString()));
    } else {
        const QJsonObject obj = doc.object();
        if (obj.value(QStringLiteral("type")).toString() == QLatin1String("error")) {
            const QString text = obj.value(QStringLiteral("message")).toString();
            ++m_stats.server_errors;
            qCWarning(dssTransport, "Depth stream error: %s", qPrintable(text));
            emit serverError(text);
        }
    }

    flush_pending();
}

void FrameTransport::on_binary(const QByteArray& payload) {
    decrement_inflight();

    const double now = m_clock.NowMs();
    m_jitter.OnArrival(now);

    auto result = m_codec.Decode(payload);
    if (result.is_error()) {
        ++m_stats.decode_failures;
        qCDebug(dssTransport, "Frame dropped: %s (%s)",
                error_code_to_string(result.error().code), result.error().message.c_str());
        // The rejected response still answers one send of its timestamp
        if (auto rejected = m_codec.rejected_timestamp()) {
            m_tracker.DiscardSend(*rejected);
        }
        flush_pending();
        return;
    }

    FramePtr frame = result.value();
    if (auto round_trip = m_tracker.TakeRoundTrip(frame->timestamp_ms(), now)) {
        m_rtt.AddSample(*round_trip);
    }
    ++m_stats.frames_received;
    emit frameReceived(frame);

    flush_pending();
}

void FrameTransport::decrement_inflight() {
    if (m_inflight > 0) --m_inflight;
}

// ============================================================================
// Outgoing requests
// ============================================================================

void FrameTransport::EnqueueRequest(TimeMs t) {
    m_pending.push_back(t);
    while (m_pending.size() > PENDING_CAPACITY) {
        const TimeMs dropped = m_pending.front();
        m_pending.pop_front();
        // Never transmitted: no send record to drop, and the gap mark
        // expires through the request timeout
        ++m_stats.pending_dropped;
        qCDebug(dssTransport, "Pending queue full, dropped request %lld",
                static_cast<long long>(dropped));
    }
    flush_pending();
}

void FrameTransport::flush_pending() {
    if (m_state != State::Open) return;

    while (!m_pending.empty()) {
        const TimeMs t = m_pending.front();
        QJsonObject request;
        request.insert(QStringLiteral("time_ms"), static_cast<qint64>(t));
        const QString message = QString::fromUtf8(QJsonDocument(request).toJson(QJsonDocument::Compact));

        if (!m_channel->SendText(message)) {
            qCWarning(dssTransport, "Send failed for %lld, %zu request(s) left queued",
                      static_cast<long long>(t), m_pending.size());
            return;
        }
        m_pending.pop_front();
        ++m_inflight;
        ++m_stats.requests_sent;
        m_tracker.RecordSend(t, m_clock.NowMs());
    }
}

} // namespace dss
