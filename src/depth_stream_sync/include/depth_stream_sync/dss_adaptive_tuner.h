#pragma once

#include "dss_status_source.h"
#include "dss_tuning.h"

#include <QObject>
#include <optional>

class QTimer;

namespace dss {

// Periodically samples server status and retunes the flow-control
// parameters in a TuningStore. Runs on its own timer, independent of the
// scheduler tick; at most one status request is outstanding.
class AdaptiveTuner : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_INTERVAL_MS = 500;

    // source and store must outlive the tuner
    AdaptiveTuner(StatusSource& source, TuningStore& store, QObject* parent = nullptr);

    void Start(int interval_ms = DEFAULT_INTERVAL_MS);
    void Stop();
    bool IsRunning() const;

    // One poll cycle (normally driven by the timer)
    void PollNow();

    // Retune from one status sample and write the result to the store
    TuningDecision ApplyStatus(const ServerStatus& status);

    const std::optional<ServerStatus>& last_status() const { return m_last_status; }
    int64_t failed_polls() const { return m_failed_polls; }

signals:
    void statusUpdated(const dss::ServerStatus& status);

private:
    StatusSource& m_source;
    TuningStore& m_store;
    QTimer* m_timer;             // owned (QObject child)
    bool m_poll_outstanding = false;
    uint64_t m_generation = 0;   // bumped by Stop(); stale replies are ignored
    std::optional<ServerStatus> m_last_status;
    int64_t m_failed_polls = 0;
};

} // namespace dss

Q_DECLARE_METATYPE(dss::ServerStatus)
