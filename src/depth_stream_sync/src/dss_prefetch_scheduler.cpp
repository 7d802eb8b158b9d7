#include <depth_stream_sync/dss_prefetch_scheduler.h>

#include <QLoggingCategory>
#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(dssScheduler, "dss.scheduler")

namespace dss {

PrefetchScheduler::PrefetchScheduler(JitterBuffer& buffer, FrameRequester& requester, double fps)
    : m_buffer(buffer)
    , m_requester(requester)
    , m_step_ms(frame_step_ms(fps)) {
}

void PrefetchScheduler::SetFps(double fps) {
    m_step_ms = frame_step_ms(fps);
}

double PrefetchScheduler::ComputeLeadMs(double rtt_ms, const TuningSnapshot& tuning) {
    if (!tuning.auto_lead_enabled) {
        return static_cast<double>(tuning.lead_time_ms);
    }
    // Unknown RTT reads as 0 and yields the 100ms floor
    const double lead = std::max(AUTO_LEAD_MIN_MS, rtt_ms + AUTO_LEAD_MARGIN_MS);
    return std::clamp(lead, AUTO_LEAD_MIN_MS, AUTO_LEAD_MAX_MS);
}

double PrefetchScheduler::ComputeTimeoutMs(double rtt_ms) {
    return std::max(MIN_TIMEOUT_MS, rtt_ms * 2.0 + TIMEOUT_MARGIN_MS);
}

TickReport PrefetchScheduler::Tick(double playback_ms, TuningSnapshot tuning) {
    TickReport report;
    const double rtt = m_requester.RoundTripMs();

    report.lead_ms = ComputeLeadMs(rtt, tuning);
    report.timeout_ms = ComputeTimeoutMs(rtt);

    // Align the window start to the frame grid
    const double start = std::max(0.0, playback_ms + report.lead_ms);
    report.window_start_ms = std::ceil(start / m_step_ms) * m_step_ms;
    report.window_end_ms = report.window_start_ms + WINDOW_MS;

    const int inflight = m_requester.InflightCount();
    report.available_slots = std::max(0, tuning.max_inflight_requests - inflight);

    if (report.available_slots == 0) {
        report.throttled = true;
    } else {
        report.issued = m_buffer.GetMissing(report.window_start_ms, report.window_end_ms,
                                            m_step_ms, report.timeout_ms,
                                            static_cast<size_t>(report.available_slots));
        for (TimeMs t : report.issued) {
            m_requester.RequestFrame(t);
        }
        if (!report.issued.empty()) {
            qCDebug(dssScheduler, "RTT=%.0fms Lead=%.0fms Inflight=%d/%d Req=%zu",
                    rtt, report.lead_ms, inflight, tuning.max_inflight_requests,
                    report.issued.size());
        }
    }

    m_buffer.Cleanup(playback_ms);
    return report;
}

} // namespace dss
