#pragma once

#include "dss_time.h"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>

namespace dss {

// Single request-tracking table keyed by stream timestamp.
//
// Two views share each entry:
//   - gap view: when the timestamp was last marked requested (timeout re-issue)
//   - RTT view: FIFO of transmit times, one per request actually sent
// A timestamp requested twice before resolving keeps both transmit times, so
// the first response is timed against the first send.
class RequestTracker {
public:
    // ── Gap view ──
    void MarkRequested(TimeMs t, double now_ms);

    // Marked and not yet timed out
    bool IsAwaiting(TimeMs t, double now_ms, double timeout_ms) const;

    std::optional<double> RequestedAt(TimeMs t) const;

    // ── RTT view ──
    void RecordSend(TimeMs t, double now_ms);

    // Pops the oldest outstanding transmit of t; returns elapsed ms
    std::optional<double> TakeRoundTrip(TimeMs t, double now_ms);

    // A response for t was rejected: its transmit is answered, not timed
    void DiscardSend(TimeMs t);

    // Drop transmits of t made at or before cutoff_ms (request given up on)
    void ExpireSends(TimeMs t, double cutoff_ms);

    // ── Invalidation ──

    // Frame for t arrived: clear the gap mark; the entry survives only while
    // further transmits are still outstanding
    void Resolve(TimeMs t);

    // Drop entries with timestamp < cutoff
    void PruneBefore(TimeMs cutoff);

    // Connection lost: nothing in flight can resolve any more
    void ForgetSends();

    void Clear() { m_entries.clear(); }

    size_t RequestedCount() const;
    size_t OutstandingSends() const;
    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        std::optional<double> requested_at;
        std::deque<double> sent_at;

        bool empty() const { return !requested_at && sent_at.empty(); }
    };

    std::map<TimeMs, Entry> m_entries;
};

} // namespace dss
