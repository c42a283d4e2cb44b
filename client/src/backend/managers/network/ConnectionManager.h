#ifndef CONNECTIONMANAGER_H
#define CONNECTIONMANAGER_H

#include <QObject>
#include <QPointer>
#include <QTimer>
#include <QString>
#include <QUrl>
#include "backend/network/PushConnection.h"

class CredentialResolver;
class EventRouter;

/**
 * @brief Owns the single push-channel connection to the engine
 *
 * ConnectionManager drives the connection lifecycle:
 * - connect -> authenticate (token in the target URL) -> subscribe
 * - forwarding decoded envelopes to the EventRouter
 * - reconnecting after an unexpected close while enabled
 * - cancelling every timer on disable or explicit disconnect
 *
 * Each attempt gets a fresh PushConnection; the previous one is closed and
 * discarded without draining, so its keepalive can never fire again.
 */
class ConnectionManager : public QObject {
    Q_OBJECT

public:
    enum class BackoffMode {
        Fixed,
        Exponential
    };

    struct ReconnectPolicy {
        BackoffMode mode = BackoffMode::Fixed;
        int baseDelayMs = 3000;
        int maxDelayMs = 30000;  // only used by Exponential
    };

    /**
     * @brief Construct a ConnectionManager
     * @param credentials Resolver for the bearer token
     * @param router Registry receiving every application-level envelope
     * @param parent Parent QObject for memory management
     */
    ConnectionManager(CredentialResolver* credentials, EventRouter* router, QObject* parent = nullptr);
    ~ConnectionManager() override;

    void setReconnectPolicy(const ReconnectPolicy& policy) { m_policy = policy; }
    ReconnectPolicy reconnectPolicy() const { return m_policy; }
    void setKeepaliveInterval(int intervalMs) { m_keepaliveIntervalMs = intervalMs; }
    int keepaliveInterval() const { return m_keepaliveIntervalMs; }

    /**
     * @brief Establish (or re-establish) the connection for an endpoint
     * @param port Engine port; 0 means unknown: the current connection and any
     *             pending retry are dropped and the manager stays idle
     * @param enabled When false, tears down and stays disconnected
     */
    void connectToEngine(quint16 port, bool enabled = true);

    /**
     * @brief Tear down the connection and cancel pending timers; no retry follows
     */
    void disconnectFromEngine();

    /**
     * @brief Toggle the enabling condition, reconnecting to the last port when re-enabled
     */
    void setEnabled(bool enabled);

    bool isEnabled() const { return m_enabled; }
    bool isConnected() const { return m_state == ConnectionState::Connected; }
    ConnectionState state() const { return m_state; }
    quint16 port() const { return m_port; }
    int reconnectAttempts() const { return m_reconnectAttempts; }
    bool isReconnectScheduled() const { return m_reconnectTimer->isActive(); }
    int connectionAttempts() const { return m_connectionAttempts; }
    const PushConnection* activeConnection() const { return m_connection; }

    static QUrl buildEndpointUrl(quint16 port, const QString& token);

signals:
    /**
     * @brief The only status consumers see: "live updates connected"
     */
    void connectedChanged(bool connected);
    void stateChanged(ConnectionState state);
    void statusChanged(const QString& status);
    void reconnectScheduled(int delayMs);
    void connectionAttempted(const QUrl& url);
    // Forwarded from the active epoch only
    void frameDropped(const QString& reason);
    void transportError(const QString& error);

private slots:
    void onConnectionOpened();
    void onConnectionClosed();
    void onEnvelopeReceived(const Envelope& envelope);
    void attemptReconnect();

private:
    void openConnection();
    void discardConnection();
    void scheduleReconnect();
    int calculateReconnectDelay() const;
    void setState(ConnectionState state);

    CredentialResolver* m_credentials;
    QPointer<EventRouter> m_router;
    PushConnection* m_connection = nullptr;
    QTimer* m_reconnectTimer;
    ReconnectPolicy m_policy;
    int m_keepaliveIntervalMs = PushConnection::DEFAULT_KEEPALIVE_INTERVAL_MS;
    quint16 m_port = 0;
    bool m_enabled = false;
    bool m_isManualDisconnect = false;
    int m_reconnectAttempts = 0;
    int m_connectionAttempts = 0;
    ConnectionState m_state = ConnectionState::Disconnected;
};

#endif // CONNECTIONMANAGER_H
