#include <depth_stream_sync/dss_wire_codec.h>

#include <QLoggingCategory>
#include <QtEndian>
#include <cstring>
#include <zlib.h>

Q_LOGGING_CATEGORY(dssCodec, "dss.codec")

namespace dss {

namespace {

float read_f32_le(const uchar* p) {
    quint32 bits = qFromLittleEndian<quint32>(p);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

void write_f32_le(float value, uchar* p) {
    quint32 bits;
    std::memcpy(&bits, &value, sizeof(bits));
    qToLittleEndian<quint32>(bits, p);
}

bool tag_equals(const char* data, const char (&tag)[4]) {
    return std::memcmp(data, tag, 4) == 0;
}

} // namespace

Result<FramePtr> WireCodec::Decode(const QByteArray& bytes) {
    m_rejected_timestamp.reset();
    if (bytes.size() < wire::HEADER_SIZE) {
        ++m_stats.malformed;
        return Error::malformed("Frame shorter than header: " + std::to_string(bytes.size()) + " bytes");
    }

    const auto* p = reinterpret_cast<const uchar*>(bytes.constData());

    bool compressed;
    if (tag_equals(bytes.constData(), wire::TAG_COMPRESSED)) {
        compressed = true;
    } else if (tag_equals(bytes.constData(), wire::TAG_RAW)) {
        compressed = false;
    } else {
        ++m_stats.unknown_tag;
        return Error::unknown_format(std::string(bytes.constData(), 4));
    }

    DepthFrame::Header header;
    header.compressed = compressed;
    header.version = qFromLittleEndian<quint16>(p + 4);
    header.timestamp_ms = static_cast<TimeMs>(qFromLittleEndian<quint32>(p + 8));
    header.width = qFromLittleEndian<quint32>(p + 12);
    header.height = qFromLittleEndian<quint32>(p + 16);
    header.scale = read_f32_le(p + 20);
    header.bias = read_f32_le(p + 24);
    header.z_max = read_f32_le(p + 28);

    // Cleared again on success
    m_rejected_timestamp = header.timestamp_ms;

    if (header.version != wire::SUPPORTED_VERSION) {
        ++m_stats.version_rejected;
        return Error::version_mismatch(header.version, wire::SUPPORTED_VERSION);
    }

    const uint64_t sample_count = static_cast<uint64_t>(header.width) * header.height;
    if (sample_count == 0 || sample_count > wire::MAX_SAMPLES) {
        ++m_stats.malformed;
        return Error::malformed("Bad frame dimensions " + std::to_string(header.width) +
                                "x" + std::to_string(header.height));
    }

    // Ordering guard: late frames are dropped, a large backward jump is a seek
    bool is_seek = false;
    if (m_last_timestamp >= 0 && header.timestamp_ms < m_last_timestamp) {
        if (m_last_timestamp - header.timestamp_ms > wire::SEEK_THRESHOLD_MS) {
            is_seek = true;
        } else {
            ++m_stats.out_of_order;
            return Error::out_of_order("Frame " + std::to_string(header.timestamp_ms) +
                                       " behind cursor " + std::to_string(m_last_timestamp));
        }
    }

    auto samples = read_samples(bytes, compressed, sample_count);
    if (samples.is_error()) {
        return samples.error();
    }

    const auto& raw = samples.value();
    std::vector<float> depth(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        depth[i] = static_cast<float>(raw[i]) * header.scale + header.bias;
    }

    if (is_seek) {
        ++m_stats.seeks;
        qCDebug(dssCodec, "Seek detected: %lld -> %lld",
                static_cast<long long>(m_last_timestamp),
                static_cast<long long>(header.timestamp_ms));
    }
    m_last_timestamp = header.timestamp_ms;
    m_rejected_timestamp.reset();
    ++m_stats.decoded;

    return FramePtr(std::make_shared<const DepthFrame>(header, std::move(depth)));
}

Result<std::vector<uint16_t>> WireCodec::read_samples(const QByteArray& bytes, bool compressed,
                                                      uint64_t sample_count) {
    const qsizetype expected_bytes = static_cast<qsizetype>(sample_count * 2);
    const qsizetype payload_size = bytes.size() - wire::HEADER_SIZE;
    const char* payload = bytes.constData() + wire::HEADER_SIZE;

    QByteArray inflated;
    if (compressed) {
        // One spare byte in the output detects a stream that inflates past
        // the declared dimensions without inflating all of it
        inflated.resize(expected_bytes + 1);
        z_stream zs{};
        if (inflateInit(&zs) != Z_OK) {
            ++m_stats.decompress_failed;
            return Error::internal("inflateInit failed");
        }
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(payload));
        zs.avail_in = static_cast<uInt>(payload_size);
        zs.next_out = reinterpret_cast<Bytef*>(inflated.data());
        zs.avail_out = static_cast<uInt>(inflated.size());
        const int rc = inflate(&zs, Z_FINISH);
        const uLong produced = zs.total_out;
        const bool output_full = (zs.avail_out == 0);
        inflateEnd(&zs);

        if (rc != Z_STREAM_END) {
            ++m_stats.decompress_failed;
            qCWarning(dssCodec, "Decompression failed (zlib %d, %lld compressed bytes)",
                      rc, static_cast<long long>(payload_size));
            return Error::decompress_failed(output_full ? "zlib stream larger than frame"
                                                        : "zlib inflate failed");
        }
        inflated.truncate(static_cast<qsizetype>(produced));
        payload = inflated.constData();
    }

    const qsizetype got_bytes = compressed ? inflated.size() : payload_size;
    if (got_bytes != expected_bytes) {
        ++m_stats.malformed;
        return Error::malformed("Payload is " + std::to_string(got_bytes) +
                                " bytes, expected " + std::to_string(expected_bytes));
    }

    std::vector<uint16_t> out(static_cast<size_t>(sample_count));
    const auto* src = reinterpret_cast<const uchar*>(payload);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = qFromLittleEndian<quint16>(src + i * 2);
    }
    return out;
}

QByteArray WireCodec::Encode(const DepthFrame::Header& header,
                             const std::vector<uint16_t>& samples,
                             bool compress) {
    QByteArray out(wire::HEADER_SIZE, Qt::Uninitialized);
    auto* p = reinterpret_cast<uchar*>(out.data());
    std::memcpy(p, compress ? wire::TAG_COMPRESSED : wire::TAG_RAW, 4);
    qToLittleEndian<quint16>(header.version, p + 4);
    qToLittleEndian<quint16>(wire::SAMPLE_TYPE_U16, p + 6);
    qToLittleEndian<quint32>(static_cast<quint32>(header.timestamp_ms), p + 8);
    qToLittleEndian<quint32>(header.width, p + 12);
    qToLittleEndian<quint32>(header.height, p + 16);
    write_f32_le(header.scale, p + 20);
    write_f32_le(header.bias, p + 24);
    write_f32_le(header.z_max, p + 28);

    QByteArray raw(static_cast<qsizetype>(samples.size() * 2), Qt::Uninitialized);
    auto* dst = reinterpret_cast<uchar*>(raw.data());
    for (size_t i = 0; i < samples.size(); ++i) {
        qToLittleEndian<quint16>(samples[i], dst + i * 2);
    }

    if (compress) {
        uLongf packed_size = compressBound(static_cast<uLong>(raw.size()));
        QByteArray packed(static_cast<qsizetype>(packed_size), Qt::Uninitialized);
        const int rc = compress2(reinterpret_cast<Bytef*>(packed.data()), &packed_size,
                                 reinterpret_cast<const Bytef*>(raw.constData()),
                                 static_cast<uLong>(raw.size()), 1);
        if (rc != Z_OK) {
            qCWarning(dssCodec, "compress2 failed (zlib %d)", rc);
            return {};
        }
        packed.truncate(static_cast<qsizetype>(packed_size));
        out.append(packed);
    } else {
        out.append(raw);
    }
    return out;
}

} // namespace dss
