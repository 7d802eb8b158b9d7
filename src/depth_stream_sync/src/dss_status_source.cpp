#include <depth_stream_sync/dss_status_source.h>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

Q_LOGGING_CATEGORY(dssStatus, "dss.tuner.status")

namespace dss {

namespace {

std::optional<int64_t> optional_int(const QJsonObject& obj, const char* key) {
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    return static_cast<int64_t>(v.toDouble());
}

} // namespace

Result<ServerStatus> ParseServerStatus(const QByteArray& json) {
    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Error::malformed("Status is not JSON: " + parse_error.errorString().toStdString());
    }
    if (!doc.isObject()) {
        return Error::malformed("Status is not a JSON object");
    }
    const QJsonObject root = doc.object();

    ServerStatus status;
    status.session_id = root.value(QStringLiteral("session_id")).toString().toStdString();
    status.width = root.value(QStringLiteral("width")).toInt();
    status.height = root.value(QStringLiteral("height")).toInt();
    status.fps = root.value(QStringLiteral("fps")).toDouble();
    status.duration_ms = optional_int(root, "duration_ms");
    status.buffer_length = root.value(QStringLiteral("buffer_length")).toInt(0);
    status.last_depth_time_ms = optional_int(root, "last_depth_time_ms");

    const QJsonValue stats_value = root.value(QStringLiteral("rolling_stats"));
    if (stats_value.isObject()) {
        const QJsonObject stats = stats_value.toObject();
        RollingStats& rs = status.rolling_stats;
        rs.depth_fps = stats.value(QStringLiteral("depth_fps")).toDouble();
        rs.latency_ms = stats.value(QStringLiteral("latency_ms")).toDouble();
        rs.infer_avg_s = stats.value(QStringLiteral("infer_avg_s")).toDouble();
        rs.queue_avg_s = stats.value(QStringLiteral("queue_avg_s")).toDouble();
        rs.ws_send_avg_s = stats.value(QStringLiteral("ws_send_avg_s")).toDouble();
        const QJsonValue decode = stats.value(QStringLiteral("decode_avg_s"));
        if (decode.isDouble()) {
            rs.decode_avg_s = decode.toDouble();
        }
        rs.drop_count = static_cast<int64_t>(stats.value(QStringLiteral("drop_count")).toDouble());
    }

    const QJsonValue config_value = root.value(QStringLiteral("config"));
    if (config_value.isObject()) {
        const QJsonObject config = config_value.toObject();
        ServerConfigInfo& cfg = status.config;
        cfg.inference_workers = config.value(QStringLiteral("inference_workers")).toInt(0);
        cfg.process_res = config.value(QStringLiteral("process_res")).toInt(cfg.process_res);
        cfg.downsample_factor = config.value(QStringLiteral("downsample_factor")).toInt(cfg.downsample_factor);
    }

    return status;
}

HttpStatusSource::HttpStatusSource(const QUrl& status_url, QObject* parent)
    : QObject(parent)
    , m_url(status_url)
    , m_network(new QNetworkAccessManager(this)) {
}

void HttpStatusSource::FetchStatus(Callback done) {
    QNetworkRequest request(m_url);
    request.setTransferTimeout(TRANSFER_TIMEOUT_MS);
    QNetworkReply* reply = m_network->get(request);

    connect(reply, &QNetworkReply::finished, this, [reply, done = std::move(done)]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            qCDebug(dssStatus, "Status poll failed: %s", qPrintable(reply->errorString()));
            done(Error::network_failed(reply->errorString().toStdString()));
            return;
        }
        done(ParseServerStatus(reply->readAll()));
    });
}

HttpLogSink::HttpLogSink(const QUrl& log_url, QObject* parent)
    : QObject(parent)
    , m_url(log_url)
    , m_network(new QNetworkAccessManager(this)) {
}

void HttpLogSink::PostLog(const QString& message) {
    QNetworkRequest request(m_url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(HttpStatusSource::TRANSFER_TIMEOUT_MS);

    QJsonObject body;
    body.insert(QStringLiteral("message"), message);
    QNetworkReply* reply = m_network->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));

    connect(reply, &QNetworkReply::finished, this, [reply]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            qCDebug(dssStatus, "Log post failed: %s", qPrintable(reply->errorString()));
        }
    });
}

} // namespace dss
