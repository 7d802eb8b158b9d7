#pragma once

#include "dss_adaptive_tuner.h"
#include "dss_frame_transport.h"
#include "dss_jitter_buffer.h"
#include "dss_message_channel.h"
#include "dss_prefetch_scheduler.h"
#include "dss_status_source.h"
#include "dss_sync_config.h"
#include "dss_tuning.h"

#include <QObject>
#include <QString>
#include <memory>

class QTimer;

namespace dss {

// Playback-side sync statistics between health reports
struct SyncStats {
    int64_t hits = 0;
    int64_t misses = 0;        // no frame in tolerance, buffer not empty
    int64_t starved = 0;       // buffer empty
    double delta_sum_ms = 0.0;
    double delta_max_ms = 0.0;

    double mean_delta_ms() const { return hits > 0 ? delta_sum_ms / hits : 0.0; }
};

// One depth stream bound to one video playback. Wires transport, buffer,
// scheduler and tuner together; the host drives Tick() and FrameAt() from
// its display refresh callback.
class DepthSyncSession : public QObject {
    Q_OBJECT

public:
    // Production wiring: QWebSocket channel, HTTP status poll and log post,
    // steady clock
    static std::unique_ptr<DepthSyncSession> Create(const SyncConfig& config,
                                                    QObject* parent = nullptr);

    DepthSyncSession(const SyncConfig& config,
                     std::unique_ptr<MessageChannel> channel,
                     std::unique_ptr<StatusSource> status_source,
                     std::unique_ptr<Clock> clock,
                     std::unique_ptr<LogSink> log_sink,
                     QObject* parent = nullptr);
    ~DepthSyncSession() override;

    void Start();
    void Stop();
    bool IsRunning() const { return m_running; }

    // Once per display refresh. Returns what was requested.
    TickReport Tick(double playback_ms);

    // Frame to render at playback_ms, or nullptr
    FramePtr FrameAt(double playback_ms);

    // Playback jumped or restarted: drop buffered frames and all in-flight
    // work, then reconnect so stale responses cannot land in the new buffer
    void Seek();

    // Logs, forwards to the log sink (if any) and returns the periodic
    // health line; resets SyncStats
    QString ReportHealth();

    const SyncConfig& config() const { return m_config; }
    JitterBuffer& buffer() { return m_buffer; }
    FrameTransport& transport() { return *m_transport; }
    PrefetchScheduler& scheduler() { return m_scheduler; }
    TuningStore& tuning() { return m_tuning; }
    AdaptiveTuner& tuner() { return *m_tuner; }
    const SyncStats& sync_stats() const { return m_sync_stats; }

signals:
    void connectedChanged(bool connected);

private:
    SyncConfig m_config;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<StatusSource> m_status_source;
    std::unique_ptr<LogSink> m_log_sink;   // may be null
    TuningStore m_tuning;
    JitterBuffer m_buffer;
    FrameTransport* m_transport;   // owned (QObject child)
    PrefetchScheduler m_scheduler;
    AdaptiveTuner* m_tuner;        // owned (QObject child)
    QTimer* m_health_timer;        // owned (QObject child)

    bool m_running = false;
    SyncStats m_sync_stats;
};

} // namespace dss
