#include <depth_stream_sync/dss_depth_sync_session.h>

#include <QLoggingCategory>
#include <QTimer>
#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(dssSession, "dss.session")

namespace dss {

std::unique_ptr<DepthSyncSession> DepthSyncSession::Create(const SyncConfig& config,
                                                           QObject* parent) {
    return std::make_unique<DepthSyncSession>(
        config,
        std::make_unique<WebSocketChannel>(),
        std::make_unique<HttpStatusSource>(status_url(config)),
        std::make_unique<SteadyClock>(),
        std::make_unique<HttpLogSink>(log_url(config)),
        parent);
}

DepthSyncSession::DepthSyncSession(const SyncConfig& config,
                                   std::unique_ptr<MessageChannel> channel,
                                   std::unique_ptr<StatusSource> status_source,
                                   std::unique_ptr<Clock> clock,
                                   std::unique_ptr<LogSink> log_sink,
                                   QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_clock(std::move(clock))
    , m_status_source(std::move(status_source))
    , m_log_sink(std::move(log_sink))
    , m_tuning(config.initial_tuning)
    , m_buffer(*m_clock)
    , m_transport(new FrameTransport(std::move(channel), m_buffer.tracker(), *m_clock, this))
    , m_scheduler(m_buffer, *m_transport, config.fps)
    , m_tuner(new AdaptiveTuner(*m_status_source, m_tuning, this))
    , m_health_timer(new QTimer(this)) {

    connect(m_transport, &FrameTransport::frameReceived, this, [this](const FramePtr& frame) {
        m_buffer.Add(frame);
    });
    connect(m_transport, &FrameTransport::connectedChanged, this, &DepthSyncSession::connectedChanged);

    m_health_timer->setInterval(config.health_interval_ms);
    connect(m_health_timer, &QTimer::timeout, this, [this]() { ReportHealth(); });
}

DepthSyncSession::~DepthSyncSession() {
    // Children (transport, tuner) reference m_buffer, m_tuning and the clock;
    // stop them before members are torn down
    m_health_timer->stop();
    m_tuner->Stop();
    delete m_tuner;
    delete m_transport;
}

void DepthSyncSession::Start() {
    if (m_running) return;
    m_running = true;
    qCInfo(dssSession, "Starting depth sync for session %s (%.2f fps)",
           qPrintable(m_config.session_id), m_config.fps);
    m_transport->Connect(stream_url(m_config));
    m_tuner->Start(m_config.status_poll_interval_ms);
    m_health_timer->start();
}

void DepthSyncSession::Stop() {
    if (!m_running) return;
    m_running = false;
    m_health_timer->stop();
    m_tuner->Stop();
    m_transport->Close();
    m_transport->codec().Reset();
    m_buffer.Clear();
    qCInfo(dssSession, "Depth sync stopped for session %s", qPrintable(m_config.session_id));
}

TickReport DepthSyncSession::Tick(double playback_ms) {
    if (!m_running) return {};
    // Copy once; the tuner may rewrite the store before the next tick
    return m_scheduler.Tick(playback_ms, m_tuning.Snapshot());
}

FramePtr DepthSyncSession::FrameAt(double playback_ms) {
    FramePtr frame = m_buffer.GetFrame(playback_ms);
    if (frame) {
        const double delta = std::abs(playback_ms - static_cast<double>(frame->timestamp_ms()));
        ++m_sync_stats.hits;
        m_sync_stats.delta_sum_ms += delta;
        m_sync_stats.delta_max_ms = std::max(m_sync_stats.delta_max_ms, delta);
    } else if (m_buffer.empty()) {
        ++m_sync_stats.starved;
    } else {
        ++m_sync_stats.misses;
    }
    return frame;
}

void DepthSyncSession::Seek() {
    qCDebug(dssSession, "Seek: clearing %zu buffered frame(s)", m_buffer.size());
    m_buffer.Clear();
    m_transport->codec().Reset();
    if (m_running) {
        m_transport->Reconnect();
    }
}

QString DepthSyncSession::ReportHealth() {
    const QString message = QStringLiteral("[Health] Buffer=%1 RTT=%2ms Jitter=%3ms Inflight=%4 "
                                           "Hits=%5 Misses=%6 Starved=%7 SyncDelta=%8ms MaxDelta=%9ms")
        .arg(m_buffer.size())
        .arg(m_transport->RoundTripMs(), 0, 'f', 0)
        .arg(m_transport->JitterMs(), 0, 'f', 1)
        .arg(m_transport->InflightCount())
        .arg(m_sync_stats.hits)
        .arg(m_sync_stats.misses)
        .arg(m_sync_stats.starved)
        .arg(m_sync_stats.mean_delta_ms(), 0, 'f', 1)
        .arg(m_sync_stats.delta_max_ms, 0, 'f', 1);
    qCInfo(dssSession, "%s", qPrintable(message));
    if (m_log_sink) {
        m_log_sink->PostLog(message);
    }
    m_sync_stats = SyncStats{};
    return message;
}

} // namespace dss
