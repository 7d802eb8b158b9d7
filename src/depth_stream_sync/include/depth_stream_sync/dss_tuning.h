#pragma once

#include <QObject>
#include <cstdint>
#include <optional>
#include <string>

namespace dss {

// Flow-control parameters read by the scheduler once per tick.
struct TuningSnapshot {
    int max_inflight_requests = 8;
    int lead_time_ms = 2000;
    bool auto_lead_enabled = false;

    bool operator==(const TuningSnapshot& o) const {
        return max_inflight_requests == o.max_inflight_requests &&
               lead_time_ms == o.lead_time_ms &&
               auto_lead_enabled == o.auto_lead_enabled;
    }
    bool operator!=(const TuningSnapshot& o) const { return !(*this == o); }
};

// Server-side rolling averages (seconds unless noted)
struct RollingStats {
    double depth_fps = 0.0;
    double latency_ms = 0.0;
    double infer_avg_s = 0.0;
    double queue_avg_s = 0.0;
    double ws_send_avg_s = 0.0;
    std::optional<double> decode_avg_s;
    int64_t drop_count = 0;
};

struct ServerConfigInfo {
    int inference_workers = 3;
    int process_res = 640;
    int downsample_factor = 1;
};

// Parsed response of the session status poll
struct ServerStatus {
    std::string session_id;
    int width = 0;
    int height = 0;
    double fps = 0.0;
    std::optional<int64_t> duration_ms;
    int buffer_length = 0;
    std::optional<int64_t> last_depth_time_ms;
    RollingStats rolling_stats;
    ServerConfigInfo config;
};

namespace tuning {
    constexpr int INFLIGHT_PER_WORKER = 4;
    constexpr double PIPELINE_LEAD_PER_WORKER_MS = 40.0;
    constexpr double DEFAULT_DECODE_S = 0.05;
    constexpr double SAFETY_BASE_S = 0.05;
    constexpr double SAFETY_INFER_FRACTION = 0.1;
    constexpr double MIN_LEAD_MS = 50.0;
    constexpr double MAX_LEAD_MS = 2000.0;
    constexpr double LEAD_HYSTERESIS_MS = 20.0;

    // workers * 4 keeps the pipeline full across one round trip; 0 if unknown
    int target_inflight(const ServerStatus& status);

    // Lead covering queue + decode + inference + safety margin, raised to the
    // per-worker pipeline minimum. Not clamped.
    double lead_candidate_ms(const ServerStatus& status);

    double clamp_lead_ms(double lead_ms);
}

struct TuningDecision {
    TuningSnapshot next;
    bool inflight_changed = false;
    bool lead_changed = false;

    bool changed() const { return inflight_changed || lead_changed; }
};

// Pure retuning step: current parameters + one status sample -> new parameters
TuningDecision Retune(const TuningSnapshot& current, const ServerStatus& status);

// Holder of the live TuningSnapshot. Readers get copies; a reader never sees
// a half-applied update.
class TuningStore : public QObject {
    Q_OBJECT

public:
    explicit TuningStore(const TuningSnapshot& initial, QObject* parent = nullptr)
        : QObject(parent), m_current(initial) {}

    TuningSnapshot Snapshot() const { return m_current; }

    void Apply(const TuningSnapshot& next);
    void SetMaxInflightRequests(int value);
    void SetLeadTimeMs(int value);
    void SetAutoLeadEnabled(bool enabled);

signals:
    void changed(const dss::TuningSnapshot& snapshot);

private:
    TuningSnapshot m_current;
};

} // namespace dss

Q_DECLARE_METATYPE(dss::TuningSnapshot)
