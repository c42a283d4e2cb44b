#ifndef PUSHCONNECTION_H
#define PUSHCONNECTION_H

#include <QObject>
#include <QWebSocket>
#include <QJsonObject>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QMetaType>
#include "backend/domain/models/Envelope.h"

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

QString connectionStateToString(ConnectionState state);

Q_DECLARE_METATYPE(ConnectionState)

/**
 * @brief One push-channel connection epoch
 *
 * Wraps a single QWebSocket together with its keepalive timer. On open it
 * sends the subscription request and starts pinging; on close it stops the
 * timer and emits closed() exactly once. A PushConnection is never reopened:
 * the ConnectionManager discards it and builds a new one for every attempt.
 */
class PushConnection : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_KEEPALIVE_INTERVAL_MS = 25000;

    explicit PushConnection(int keepaliveIntervalMs = DEFAULT_KEEPALIVE_INTERVAL_MS, QObject* parent = nullptr);
    ~PushConnection() override;

    void open(const QUrl& url);
    // Drops the transport immediately; pending inbound frames are discarded
    void close();

    ConnectionState state() const { return m_state; }
    bool isOpen() const;
    bool isKeepaliveActive() const { return m_keepaliveTimer->isActive(); }
    QUrl url() const { return m_url; }

    bool sendMessage(const QJsonObject& message);
    bool sendPing();
    bool sendSubscribe(const QStringList& topics);

signals:
    void opened();
    void closed();
    void envelopeReceived(const Envelope& envelope);
    void frameDropped(const QString& reason);
    void transportError(const QString& error);

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessageReceived(const QString& message);
    void onError(QAbstractSocket::SocketError error);

private:
    void handleClosed();
    void setState(ConnectionState state);

    QWebSocket* m_webSocket;
    QTimer* m_keepaliveTimer;
    QUrl m_url;
    ConnectionState m_state = ConnectionState::Disconnected;
    bool m_closedEmitted = false;
};

#endif // PUSHCONNECTION_H
