#pragma once

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

class QWebSocket;

namespace dss {

// Bidirectional message link to the depth server. Every inbound event
// (open, close, failure, text, binary) leaves through this one object, in
// arrival order, on the owning thread's event loop.
class MessageChannel : public QObject {
    Q_OBJECT

public:
    explicit MessageChannel(QObject* parent = nullptr) : QObject(parent) {}
    ~MessageChannel() override = default;

    virtual void Open(const QUrl& url) = 0;
    virtual void Close() = 0;

    // false if the message could not be handed to the link
    virtual bool SendText(const QString& message) = 0;

signals:
    void opened();
    void closed();
    void failed(const QString& reason);
    void textReceived(const QString& message);
    void binaryReceived(const QByteArray& payload);
};

// MessageChannel over QWebSocket. Each Open() uses a fresh socket so events
// from a previous connection can never reach the current one.
class WebSocketChannel : public MessageChannel {
    Q_OBJECT

public:
    explicit WebSocketChannel(QObject* parent = nullptr);
    ~WebSocketChannel() override;

    void Open(const QUrl& url) override;
    void Close() override;
    bool SendText(const QString& message) override;

private:
    void release_socket();

    QPointer<QWebSocket> m_socket;
};

} // namespace dss
