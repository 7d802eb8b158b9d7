#include <depth_stream_sync/dss_message_channel.h>

#include <QLoggingCategory>
#include <QWebSocket>

Q_LOGGING_CATEGORY(dssChannel, "dss.transport.channel")

namespace dss {

WebSocketChannel::WebSocketChannel(QObject* parent)
    : MessageChannel(parent) {
}

WebSocketChannel::~WebSocketChannel() {
    release_socket();
}

void WebSocketChannel::Open(const QUrl& url) {
    release_socket();

    auto* socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this);
    m_socket = socket;

    connect(socket, &QWebSocket::connected, this, &MessageChannel::opened);
    connect(socket, &QWebSocket::disconnected, this, &MessageChannel::closed);
    connect(socket, &QWebSocket::errorOccurred, this,
            [this, socket](QAbstractSocket::SocketError error) {
                qCWarning(dssChannel, "WebSocket error %d: %s",
                          static_cast<int>(error), qPrintable(socket->errorString()));
                emit failed(socket->errorString());
            });
    connect(socket, &QWebSocket::textMessageReceived, this, &MessageChannel::textReceived);
    connect(socket, &QWebSocket::binaryMessageReceived, this, &MessageChannel::binaryReceived);

    qCDebug(dssChannel, "Opening %s", qPrintable(url.toString()));
    socket->open(url);
}

void WebSocketChannel::Close() {
    release_socket();
}

bool WebSocketChannel::SendText(const QString& message) {
    if (!m_socket || m_socket->state() != QAbstractSocket::ConnectedState) {
        return false;
    }
    return m_socket->sendTextMessage(message) > 0;
}

void WebSocketChannel::release_socket() {
    if (!m_socket) return;
    QWebSocket* socket = m_socket;
    m_socket = nullptr;
    // Detach first: the close handshake must not surface as an event
    socket->disconnect(this);
    socket->close();
    socket->deleteLater();
}

} // namespace dss
