#include <depth_stream_sync/dss_adaptive_tuner.h>

#include <QLoggingCategory>
#include <QPointer>
#include <QTimer>

Q_LOGGING_CATEGORY(dssTuner, "dss.tuner")

namespace dss {

AdaptiveTuner::AdaptiveTuner(StatusSource& source, TuningStore& store, QObject* parent)
    : QObject(parent)
    , m_source(source)
    , m_store(store)
    , m_timer(new QTimer(this)) {
    m_timer->setInterval(DEFAULT_INTERVAL_MS);
    connect(m_timer, &QTimer::timeout, this, &AdaptiveTuner::PollNow);
}

void AdaptiveTuner::Start(int interval_ms) {
    m_timer->setInterval(interval_ms > 0 ? interval_ms : DEFAULT_INTERVAL_MS);
    m_timer->start();
    qCDebug(dssTuner, "Tuner started (%d ms)", m_timer->interval());
}

void AdaptiveTuner::Stop() {
    m_timer->stop();
    ++m_generation;
    m_poll_outstanding = false;
}

bool AdaptiveTuner::IsRunning() const {
    return m_timer->isActive();
}

void AdaptiveTuner::PollNow() {
    if (m_poll_outstanding) return;
    m_poll_outstanding = true;

    const uint64_t generation = m_generation;
    QPointer<AdaptiveTuner> self(this);
    m_source.FetchStatus([self, generation](Result<ServerStatus> result) {
        if (!self || self->m_generation != generation) return;
        self->m_poll_outstanding = false;
        if (result.is_error()) {
            ++self->m_failed_polls;
            qCWarning(dssTuner, "Status poll failed: %s", result.error().message.c_str());
            return;
        }
        self->ApplyStatus(result.value());
    });
}

TuningDecision AdaptiveTuner::ApplyStatus(const ServerStatus& status) {
    m_last_status = status;
    emit statusUpdated(status);

    // Re-read the store: the scheduler or the host may have written since the
    // poll was issued
    const TuningSnapshot current = m_store.Snapshot();
    TuningDecision decision = Retune(current, status);

    if (decision.inflight_changed) {
        qCDebug(dssTuner, "Adjusted maxInflight to %d (%d workers)",
                decision.next.max_inflight_requests, status.config.inference_workers);
    }
    if (decision.lead_changed) {
        qCDebug(dssTuner, "Adjusted lead to %dms (infer=%.3fs)",
                decision.next.lead_time_ms, status.rolling_stats.infer_avg_s);
    }
    if (decision.changed()) {
        m_store.Apply(decision.next);
    }
    return decision;
}

} // namespace dss
