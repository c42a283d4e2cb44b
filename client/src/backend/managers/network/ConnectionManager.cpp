#include "backend/managers/network/ConnectionManager.h"
#include "backend/network/CredentialResolver.h"
#include "backend/network/EventRouter.h"
#include <QRandomGenerator>
#include <QDebug>
#include <algorithm>

ConnectionManager::ConnectionManager(CredentialResolver* credentials, EventRouter* router, QObject* parent)
    : QObject(parent),
      m_credentials(credentials),
      m_router(router),
      m_reconnectTimer(new QTimer(this))
{
    Q_ASSERT(m_router);

    m_reconnectTimer->setSingleShot(true);
    connect(m_reconnectTimer, &QTimer::timeout, this, &ConnectionManager::attemptReconnect);
}

ConnectionManager::~ConnectionManager()
{
    m_reconnectTimer->stop();
    discardConnection();
}

QUrl ConnectionManager::buildEndpointUrl(quint16 port, const QString& token)
{
    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(QStringLiteral("127.0.0.1"));
    url.setPort(port);
    url.setPath(QStringLiteral("/ws"));
    if (!token.isEmpty()) {
        // Headers cannot be attached to the upgrade request, so the token rides in the query
        url.setQuery(QStringLiteral("token=") + QString::fromLatin1(QUrl::toPercentEncoding(token)), QUrl::StrictMode);
    }
    return url;
}

void ConnectionManager::connectToEngine(quint16 port, bool enabled)
{
    m_enabled = enabled;

    if (!m_enabled) {
        if (port != 0) {
            m_port = port;
        }
        qDebug() << "ConnectionManager: Live updates disabled, staying disconnected";
        disconnectFromEngine();
        return;
    }
    if (port == 0) {
        // No endpoint: drop the current epoch and any pending retry, keep the last usable port
        qWarning() << "ConnectionManager: Cannot connect without an engine port";
        m_reconnectTimer->stop();
        m_reconnectAttempts = 0;
        discardConnection();
        setState(ConnectionState::Disconnected);
        return;
    }

    m_port = port;
    m_isManualDisconnect = false;
    m_reconnectAttempts = 0;
    openConnection();
}

void ConnectionManager::disconnectFromEngine()
{
    m_isManualDisconnect = true;
    m_reconnectTimer->stop();
    m_reconnectAttempts = 0;
    discardConnection();
    setState(ConnectionState::Disconnected);
}

void ConnectionManager::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }
    if (!enabled) {
        m_enabled = false;
        disconnectFromEngine();
        return;
    }
    connectToEngine(m_port, true);
}

void ConnectionManager::openConnection()
{
    m_reconnectTimer->stop();
    discardConnection();

    if (!m_enabled || m_isManualDisconnect) {
        return;
    }

    QString token;
    if (!m_credentials || !m_credentials->resolveToken(&token)) {
        qDebug() << "ConnectionManager: No token available, connecting unauthenticated";
        token.clear();
    }
    const QUrl url = buildEndpointUrl(m_port, token);

    m_connection = new PushConnection(m_keepaliveIntervalMs, this);
    connect(m_connection, &PushConnection::opened, this, &ConnectionManager::onConnectionOpened);
    connect(m_connection, &PushConnection::closed, this, &ConnectionManager::onConnectionClosed);
    connect(m_connection, &PushConnection::envelopeReceived, this, &ConnectionManager::onEnvelopeReceived);
    connect(m_connection, &PushConnection::frameDropped, this, &ConnectionManager::frameDropped);
    connect(m_connection, &PushConnection::transportError, this, &ConnectionManager::transportError);

    ++m_connectionAttempts;
    setState(ConnectionState::Connecting);
    qDebug() << "ConnectionManager: Connecting to engine on port" << m_port;
    emit connectionAttempted(url);
    m_connection->open(url);
}

void ConnectionManager::discardConnection()
{
    if (!m_connection) {
        return;
    }
    PushConnection* old = m_connection;
    m_connection = nullptr;
    QObject::disconnect(old, nullptr, this, nullptr);
    old->close();
    old->deleteLater();
}

void ConnectionManager::onConnectionOpened()
{
    if (sender() != m_connection) {
        return;
    }
    qDebug() << "ConnectionManager: Connected successfully";
    m_reconnectAttempts = 0;
    m_reconnectTimer->stop();
    setState(ConnectionState::Connected);
}

void ConnectionManager::onConnectionClosed()
{
    if (sender() != m_connection) {
        return;
    }
    qDebug() << "ConnectionManager: Disconnected";
    discardConnection();
    setState(ConnectionState::Disconnected);

    if (m_enabled && !m_isManualDisconnect) {
        scheduleReconnect();
    }
}

void ConnectionManager::onEnvelopeReceived(const Envelope& envelope)
{
    if (sender() != m_connection || !m_router) {
        return;
    }
    m_router->dispatch(envelope);
}

void ConnectionManager::scheduleReconnect()
{
    if (m_reconnectTimer->isActive()) {
        return; // Already scheduled
    }

    const int delay = calculateReconnectDelay();
    m_reconnectAttempts++;

    qDebug() << "ConnectionManager: Scheduling reconnect attempt" << m_reconnectAttempts
             << "in" << delay << "ms";

    emit statusChanged(QString("Reconnecting (%1)...").arg(m_reconnectAttempts));
    emit reconnectScheduled(delay);
    m_reconnectTimer->start(delay);
}

int ConnectionManager::calculateReconnectDelay() const
{
    if (m_policy.mode == BackoffMode::Fixed) {
        return m_policy.baseDelayMs;
    }

    // Exponential backoff: base * 2^attempts, capped, with +/-25% jitter
    const int exponent = std::min(m_reconnectAttempts, 16);
    const qint64 exponentialDelay = static_cast<qint64>(m_policy.baseDelayMs) << exponent;
    int delay = static_cast<int>(std::min<qint64>(exponentialDelay, m_policy.maxDelayMs));
    const int spread = delay / 4;
    if (spread > 0) {
        delay += QRandomGenerator::global()->bounded(-spread, spread);
    }
    return std::max(delay, 0);
}

void ConnectionManager::attemptReconnect()
{
    if (!m_enabled || m_isManualDisconnect) {
        qDebug() << "ConnectionManager: Skipping reconnect (disabled or manual disconnect)";
        return;
    }

    qDebug() << "ConnectionManager: Attempting reconnect to port" << m_port;
    openConnection();
}

void ConnectionManager::setState(ConnectionState state)
{
    if (m_state == state) {
        return;
    }
    const bool wasConnected = (m_state == ConnectionState::Connected);
    m_state = state;
    emit stateChanged(m_state);

    if (m_state == ConnectionState::Connected) {
        emit statusChanged("Connected");
        emit connectedChanged(true);
    } else if (wasConnected) {
        emit statusChanged("Disconnected");
        emit connectedChanged(false);
    } else if (m_state == ConnectionState::Connecting) {
        emit statusChanged("Connecting...");
    }
}
