#pragma once

#include "dss_errors.h"
#include "dss_frame.h"
#include "dss_time.h"

#include <QByteArray>
#include <cstdint>
#include <optional>
#include <vector>

namespace dss {

// Binary depth frame layout (little-endian):
//   0  tag[4]  "VDZ1" raw | "VDZ2" zlib stream
//   4  u16     version
//   6  u16     reserved (sample type, 1 = uint16)
//   8  u32     timestamp_ms
//  12  u32     width
//  16  u32     height
//  20  f32     scale
//  24  f32     bias
//  28  f32     z_max
//  32  payload width*height u16 samples
namespace wire {
    constexpr int HEADER_SIZE = 32;
    constexpr char TAG_RAW[4] = {'V', 'D', 'Z', '1'};
    constexpr char TAG_COMPRESSED[4] = {'V', 'D', 'Z', '2'};
    constexpr uint16_t SUPPORTED_VERSION = 1;
    constexpr uint16_t SAMPLE_TYPE_U16 = 1;

    // Backward jump larger than this is a seek, not a late frame
    constexpr TimeMs SEEK_THRESHOLD_MS = 500;

    // Upper bound on width*height (guards allocation from a corrupt header)
    constexpr uint64_t MAX_SAMPLES = 4096ull * 4096ull;
}

struct CodecStats {
    int64_t decoded = 0;
    int64_t unknown_tag = 0;
    int64_t malformed = 0;
    int64_t decompress_failed = 0;
    int64_t version_rejected = 0;
    int64_t out_of_order = 0;
    int64_t seeks = 0;
};

// Decoder for the depth stream wire format. Stateless apart from the
// ordering cursor (timestamp of the last accepted frame).
class WireCodec {
public:
    WireCodec() = default;

    // Decode one binary message. Rejections are counted in stats().
    Result<FramePtr> Decode(const QByteArray& bytes);

    // Build a wire message from quantized samples (tests, tooling)
    static QByteArray Encode(const DepthFrame::Header& header,
                             const std::vector<uint16_t>& samples,
                             bool compress);

    // Forget the ordering cursor (explicit seek/replay)
    void Reset() { m_last_timestamp = -1; }

    // -1 until a frame has been accepted
    TimeMs last_timestamp() const { return m_last_timestamp; }

    // Header timestamp of the last rejected message, when the header was
    // readable; nullopt after a successful decode
    std::optional<TimeMs> rejected_timestamp() const { return m_rejected_timestamp; }

    const CodecStats& stats() const { return m_stats; }

private:
    Result<std::vector<uint16_t>> read_samples(const QByteArray& bytes, bool compressed,
                                               uint64_t sample_count);

    TimeMs m_last_timestamp = -1;
    std::optional<TimeMs> m_rejected_timestamp;
    CodecStats m_stats;
};

} // namespace dss
