#include <depth_stream_sync/dss_jitter_buffer.h>

#include <QLoggingCategory>
#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(dssBuffer, "dss.buffer")

namespace dss {

void JitterBuffer::Add(FramePtr frame) {
    if (!frame) return;
    const TimeMs ts = frame->timestamp_ms();
    m_tracker.Resolve(ts);

    // Tail scan: find the last position whose timestamp is <= ts
    auto it = m_frames.end();
    while (it != m_frames.begin() && (*(it - 1))->timestamp_ms() > ts) {
        --it;
    }
    if (it != m_frames.begin() && (*(it - 1))->timestamp_ms() == ts) {
        *(it - 1) = std::move(frame);
        return;
    }
    m_frames.insert(it, std::move(frame));

    if (m_frames.size() > MAX_FRAMES) {
        size_t excess = m_frames.size() - MAX_FRAMES;
        m_frames.erase(m_frames.begin(), m_frames.begin() + static_cast<std::ptrdiff_t>(excess));
        qCDebug(dssBuffer, "Frame store over capacity, dropped %zu oldest", excess);
    }
}

FramePtr JitterBuffer::GetFrame(double t_ms) {
    FramePtr best;
    double best_diff = std::numeric_limits<double>::max();
    std::ptrdiff_t prune_idx = -1;

    for (size_t i = 0; i < m_frames.size(); ++i) {
        const double ts = static_cast<double>(m_frames[i]->timestamp_ms());
        const double diff = std::abs(ts - t_ms);

        if (ts < t_ms - PRUNE_AGE_MS) {
            prune_idx = static_cast<std::ptrdiff_t>(i);
        }
        if (diff < best_diff && diff <= MATCH_TOLERANCE_MS) {
            best_diff = diff;
            best = m_frames[i];
        }
        if (ts > t_ms + MATCH_TOLERANCE_MS) {
            break;
        }
    }

    if (prune_idx >= 0) {
        m_frames.erase(m_frames.begin(), m_frames.begin() + prune_idx + 1);
    }
    return best;
}

bool JitterBuffer::has_frame_near(double t_ms, double radius_ms) const {
    // First frame strictly after t - radius; covered if strictly before t + radius
    auto upper = std::upper_bound(m_frames.begin(), m_frames.end(), t_ms - radius_ms,
        [](double v, const FramePtr& f) { return v < static_cast<double>(f->timestamp_ms()); });
    return upper != m_frames.end() &&
           static_cast<double>((*upper)->timestamp_ms()) < t_ms + radius_ms;
}

std::vector<TimeMs> JitterBuffer::GetMissing(double start_ms, double end_ms, double step_ms,
                                             double timeout_ms, size_t max_count) {
    std::vector<TimeMs> missing;
    if (!(step_ms > 0.0)) {
        qCWarning(dssBuffer, "GetMissing: non-positive step %f ignored", step_ms);
        return missing;
    }
    if (max_count == 0) return missing;

    const double now = m_clock.NowMs();
    const double half_step = step_ms * 0.5;

    // Index the grid instead of accumulating t += step so that float error
    // never shifts a point onto a different millisecond between ticks
    for (int64_t k = 0; ; ++k) {
        const double point = start_ms + static_cast<double>(k) * step_ms;
        if (point > end_ms) break;
        const TimeMs t = static_cast<TimeMs>(std::llround(point));

        if (has_frame_near(static_cast<double>(t), half_step)) continue;
        if (m_tracker.IsAwaiting(t, now, timeout_ms)) continue;

        // Re-issue: a send this old is given up on and must not time the new one
        m_tracker.ExpireSends(t, now - timeout_ms);
        missing.push_back(t);
        m_tracker.MarkRequested(t, now);
        if (missing.size() >= max_count) break;
    }
    return missing;
}

void JitterBuffer::Cleanup(double playback_ms) {
    const auto cutoff = static_cast<TimeMs>(std::ceil(playback_ms - REQUEST_EXPIRY_MS));
    m_tracker.PruneBefore(cutoff);
}

void JitterBuffer::Clear() {
    m_frames.clear();
    m_tracker.Clear();
}

std::vector<TimeMs> JitterBuffer::timestamps() const {
    std::vector<TimeMs> out;
    out.reserve(m_frames.size());
    for (const auto& f : m_frames) {
        out.push_back(f->timestamp_ms());
    }
    return out;
}

} // namespace dss
