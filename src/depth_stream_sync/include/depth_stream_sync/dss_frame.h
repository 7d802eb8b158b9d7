#pragma once

#include "dss_time.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace dss {

// Reconstructed depth plane for one stream timestamp.
// Immutable once built; shared between the jitter buffer and the renderer.
class DepthFrame {
public:
    struct Header {
        TimeMs timestamp_ms = 0;
        uint32_t width = 0;
        uint32_t height = 0;
        float scale = 1.0f;
        float bias = 0.0f;
        float z_max = 0.0f;
        uint16_t version = 1;
        bool compressed = false;
    };

    // samples.size() must equal width * height
    DepthFrame(const Header& header, std::vector<float> samples)
        : m_header(header), m_samples(std::move(samples)) {}

    TimeMs timestamp_ms() const { return m_header.timestamp_ms; }
    uint32_t width() const { return m_header.width; }
    uint32_t height() const { return m_header.height; }
    float scale() const { return m_header.scale; }
    float bias() const { return m_header.bias; }

    // Server-suggested far clip
    float z_max() const { return m_header.z_max; }

    uint16_t version() const { return m_header.version; }
    bool compressed() const { return m_header.compressed; }
    const Header& header() const { return m_header; }

    // Row-major depth values, depth[i] = sample[i] * scale + bias
    const std::vector<float>& samples() const { return m_samples; }
    float at(uint32_t x, uint32_t y) const { return m_samples[static_cast<size_t>(y) * m_header.width + x]; }

private:
    Header m_header;
    std::vector<float> m_samples;
};

using FramePtr = std::shared_ptr<const DepthFrame>;

} // namespace dss
