#pragma once

#include "dss_errors.h"
#include "dss_tuning.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QUrl>
#include <functional>

class QNetworkAccessManager;

namespace dss {

// Parse a session status document. Missing "config" falls back to the
// server defaults (3 workers, 640px, no downsample); missing
// "rolling_stats" reads as zeros.
Result<ServerStatus> ParseServerStatus(const QByteArray& json);

// Asynchronous source of server status samples
class StatusSource {
public:
    using Callback = std::function<void(Result<ServerStatus>)>;

    virtual ~StatusSource() = default;

    // done is invoked exactly once, later, on the event loop thread
    virtual void FetchStatus(Callback done) = 0;
};

// Polls GET <base>/api/sessions/<id>/status
class HttpStatusSource : public QObject, public StatusSource {
    Q_OBJECT

public:
    static constexpr int TRANSFER_TIMEOUT_MS = 2000;

    explicit HttpStatusSource(const QUrl& status_url, QObject* parent = nullptr);

    void FetchStatus(Callback done) override;

    QUrl url() const { return m_url; }

private:
    QUrl m_url;
    QNetworkAccessManager* m_network;  // owned (QObject child)
};

// Forwards client log lines to the server (fire and forget)
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void PostLog(const QString& message) = 0;
};

// POST <base>/api/log with {"message": ...}
class HttpLogSink : public QObject, public LogSink {
    Q_OBJECT

public:
    explicit HttpLogSink(const QUrl& log_url, QObject* parent = nullptr);

    void PostLog(const QString& message) override;

    QUrl url() const { return m_url; }

private:
    QUrl m_url;
    QNetworkAccessManager* m_network;  // owned (QObject child)
};

} // namespace dss
