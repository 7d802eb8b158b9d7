#include <depth_stream_sync/dss_tuning.h>

#include <algorithm>
#include <cmath>

namespace dss {

namespace tuning {

int target_inflight(const ServerStatus& status) {
    const int workers = status.config.inference_workers;
    return workers > 0 ? workers * INFLIGHT_PER_WORKER : 0;
}

double lead_candidate_ms(const ServerStatus& status) {
    const RollingStats& stats = status.rolling_stats;
    const double safety = SAFETY_BASE_S + SAFETY_INFER_FRACTION * stats.infer_avg_s;

    // A zero decode average means the server has not measured it yet
    double decode_s = DEFAULT_DECODE_S;
    if (stats.decode_avg_s && *stats.decode_avg_s > 0.0) {
        decode_s = *stats.decode_avg_s;
    }

    const double processing_s = stats.queue_avg_s + decode_s + stats.infer_avg_s + safety;
    double lead_ms = processing_s * 1000.0;

    const int workers = status.config.inference_workers;
    if (workers > 0) {
        lead_ms = std::max(lead_ms, workers * PIPELINE_LEAD_PER_WORKER_MS);
    }
    return lead_ms;
}

double clamp_lead_ms(double lead_ms) {
    return std::clamp(lead_ms, MIN_LEAD_MS, MAX_LEAD_MS);
}

} // namespace tuning

TuningDecision Retune(const TuningSnapshot& current, const ServerStatus& status) {
    TuningDecision decision;
    decision.next = current;

    const int target = tuning::target_inflight(status);
    if (target > 0 && target != current.max_inflight_requests) {
        decision.next.max_inflight_requests = target;
        decision.inflight_changed = true;
    }

    if (!current.auto_lead_enabled) {
        return decision;
    }

    const double lead = tuning::clamp_lead_ms(tuning::lead_candidate_ms(status));
    if (std::abs(lead - current.lead_time_ms) > tuning::LEAD_HYSTERESIS_MS) {
        decision.next.lead_time_ms = static_cast<int>(std::lround(lead));
        decision.lead_changed = true;
    }
    return decision;
}

void TuningStore::Apply(const TuningSnapshot& next) {
    if (next == m_current) return;
    m_current = next;
    emit changed(m_current);
}

void TuningStore::SetMaxInflightRequests(int value) {
    TuningSnapshot next = m_current;
    next.max_inflight_requests = std::max(0, value);
    Apply(next);
}

void TuningStore::SetLeadTimeMs(int value) {
    TuningSnapshot next = m_current;
    next.lead_time_ms = std::max(0, value);
    Apply(next);
}

void TuningStore::SetAutoLeadEnabled(bool enabled) {
    TuningSnapshot next = m_current;
    next.auto_lead_enabled = enabled;
    Apply(next);
}

} // namespace dss
