#include "backend/network/PushConnection.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

namespace {
bool frameTraceEnabled() {
    static const bool enabled = qEnvironmentVariableIsSet("GAZE_SYNC_TRACE_FRAMES");
    return enabled;
}

QString describeSocketError(QAbstractSocket::SocketError error) {
    switch (error) {
        case QAbstractSocket::ConnectionRefusedError: return QStringLiteral("Connection refused");
        case QAbstractSocket::RemoteHostClosedError: return QStringLiteral("Remote host closed connection");
        case QAbstractSocket::HostNotFoundError: return QStringLiteral("Host not found");
        case QAbstractSocket::SocketTimeoutError: return QStringLiteral("Connection timeout");
        case QAbstractSocket::NetworkError: return QStringLiteral("Network error");
        default: return QString("Socket error: %1").arg(error);
    }
}
}

QString connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return QStringLiteral("disconnected");
        case ConnectionState::Connecting: return QStringLiteral("connecting");
        case ConnectionState::Connected: return QStringLiteral("connected");
        case ConnectionState::Closing: return QStringLiteral("closing");
    }
    return QStringLiteral("unknown");
}

PushConnection::PushConnection(int keepaliveIntervalMs, QObject* parent)
    : QObject(parent)
    , m_webSocket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
    , m_keepaliveTimer(new QTimer(this))
{
    m_keepaliveTimer->setInterval(keepaliveIntervalMs);
    connect(m_keepaliveTimer, &QTimer::timeout, this, &PushConnection::sendPing);

    connect(m_webSocket, &QWebSocket::connected, this, &PushConnection::onConnected);
    connect(m_webSocket, &QWebSocket::disconnected, this, &PushConnection::onDisconnected);
    connect(m_webSocket, &QWebSocket::textMessageReceived, this, &PushConnection::onTextMessageReceived);
    connect(m_webSocket, &QWebSocket::errorOccurred, this, &PushConnection::onError);
}

PushConnection::~PushConnection() {
    m_keepaliveTimer->stop();
    m_webSocket->disconnect(this);  // Disconnect all signals first
    if (m_webSocket->state() != QAbstractSocket::UnconnectedState) {
        m_webSocket->abort();
    }
}

void PushConnection::open(const QUrl& url) {
    if (m_state != ConnectionState::Disconnected || m_closedEmitted) {
        qWarning() << "PushConnection: open() called on a used connection, ignoring";
        return;
    }
    m_url = url;
    setState(ConnectionState::Connecting);
    m_webSocket->open(url);
}

void PushConnection::close() {
    m_keepaliveTimer->stop();
    if (m_state == ConnectionState::Disconnected) {
        return;
    }
    setState(ConnectionState::Closing);
    m_webSocket->abort();
    handleClosed();
}

bool PushConnection::isOpen() const {
    return m_state == ConnectionState::Connected && m_webSocket->state() == QAbstractSocket::ConnectedState;
}

bool PushConnection::sendMessage(const QJsonObject& message) {
    if (!isOpen()) {
        qWarning() << "PushConnection: Cannot send message: not connected";
        return false;
    }
    const QString jsonString = QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact));
    m_webSocket->sendTextMessage(jsonString);
    return true;
}

bool PushConnection::sendPing() {
    QJsonObject msg;
    msg["type"] = "ping";
    return sendMessage(msg);
}

bool PushConnection::sendSubscribe(const QStringList& topics) {
    QJsonObject msg;
    msg["type"] = "subscribe";
    msg["topics"] = QJsonArray::fromStringList(topics);
    return sendMessage(msg);
}

void PushConnection::onConnected() {
    qDebug() << "PushConnection: Connected to" << m_url.toString(QUrl::RemoveQuery);
    setState(ConnectionState::Connected);
    sendSubscribe(QStringList() << QStringLiteral("*"));
    m_keepaliveTimer->start();
    emit opened();
}

void PushConnection::onDisconnected() {
    qDebug() << "PushConnection: Disconnected";
    handleClosed();
}

void PushConnection::onTextMessageReceived(const QString& message) {
    bool ok = false;
    QString error;
    const Envelope envelope = Envelope::fromText(message, &ok, &error);
    if (!ok) {
        qWarning() << "PushConnection: Failed to parse message:" << error;
        emit frameDropped(error);
        return;
    }

    if (frameTraceEnabled()) {
        qDebug() << "PushConnection: Received message type:" << envelope.typeName();
    }

    switch (envelope.type()) {
        case EnvelopeType::Heartbeat:
        case EnvelopeType::Pong:
            return;
        case EnvelopeType::AuthSuccess:
            qDebug() << "PushConnection: Engine accepted token";
            return;
        default:
            emit envelopeReceived(envelope);
    }
}

void PushConnection::onError(QAbstractSocket::SocketError error) {
    const QString errorString = describeSocketError(error);
    if (m_state == ConnectionState::Closing) {
        qDebug() << "PushConnection: Ignoring socket error while closing:" << errorString;
        return;
    }
    qWarning() << "PushConnection: WebSocket error:" << errorString;
    emit transportError(errorString);

    // A failed handshake never reaches the connected state, so no disconnected() follows
    if (m_webSocket->state() == QAbstractSocket::UnconnectedState) {
        handleClosed();
    }
}

void PushConnection::handleClosed() {
    m_keepaliveTimer->stop();
    setState(ConnectionState::Disconnected);
    if (m_closedEmitted) return;
    m_closedEmitted = true;
    emit closed();
}

void PushConnection::setState(ConnectionState state) {
    m_state = state;
}
