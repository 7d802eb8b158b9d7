#include <depth_stream_sync/dss_request_tracker.h>

namespace dss {

void RequestTracker::MarkRequested(TimeMs t, double now_ms) {
    m_entries[t].requested_at = now_ms;
}

bool RequestTracker::IsAwaiting(TimeMs t, double now_ms, double timeout_ms) const {
    auto requested = RequestedAt(t);
    return requested && (now_ms - *requested) < timeout_ms;
}

std::optional<double> RequestTracker::RequestedAt(TimeMs t) const {
    auto it = m_entries.find(t);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.requested_at;
}

void RequestTracker::RecordSend(TimeMs t, double now_ms) {
    m_entries[t].sent_at.push_back(now_ms);
}

std::optional<double> RequestTracker::TakeRoundTrip(TimeMs t, double now_ms) {
    auto it = m_entries.find(t);
    if (it == m_entries.end() || it->second.sent_at.empty()) {
        return std::nullopt;
    }
    double sent = it->second.sent_at.front();
    it->second.sent_at.pop_front();
    if (it->second.empty()) {
        m_entries.erase(it);
    }
    return now_ms - sent;
}

void RequestTracker::DiscardSend(TimeMs t) {
    auto it = m_entries.find(t);
    if (it == m_entries.end() || it->second.sent_at.empty()) return;
    it->second.sent_at.pop_front();
    if (it->second.empty()) {
        m_entries.erase(it);
    }
}

void RequestTracker::ExpireSends(TimeMs t, double cutoff_ms) {
    auto it = m_entries.find(t);
    if (it == m_entries.end()) return;
    auto& sent = it->second.sent_at;
    while (!sent.empty() && sent.front() <= cutoff_ms) {
        sent.pop_front();
    }
    if (it->second.empty()) {
        m_entries.erase(it);
    }
}

void RequestTracker::Resolve(TimeMs t) {
    auto it = m_entries.find(t);
    if (it == m_entries.end()) return;
    it->second.requested_at.reset();
    if (it->second.empty()) {
        m_entries.erase(it);
    }
}

void RequestTracker::PruneBefore(TimeMs cutoff) {
    m_entries.erase(m_entries.begin(), m_entries.lower_bound(cutoff));
}

void RequestTracker::ForgetSends() {
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        it->second.sent_at.clear();
        if (it->second.empty()) {
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
}

size_t RequestTracker::RequestedCount() const {
    size_t count = 0;
    for (const auto& [t, entry] : m_entries) {
        if (entry.requested_at) ++count;
    }
    return count;
}

size_t RequestTracker::OutstandingSends() const {
    size_t count = 0;
    for (const auto& [t, entry] : m_entries) {
        count += entry.sent_at.size();
    }
    return count;
}

} // namespace dss
