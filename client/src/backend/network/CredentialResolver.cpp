#include "backend/network/CredentialResolver.h"
#include <QDebug>

CredentialResolver::CredentialResolver(QObject* parent)
    : QObject(parent)
{
}

CredentialResolver::CredentialResolver(TokenProvider tokenProvider, PortProvider portProvider, QObject* parent)
    : QObject(parent)
    , m_tokenProvider(std::move(tokenProvider))
    , m_portProvider(std::move(portProvider))
{
}

bool CredentialResolver::resolveToken(QString* token) {
    if (m_cachedToken.isEmpty()) {
        if (!m_tokenProvider) {
            return false;
        }
        QString fetched;
        QString error;
        if (!m_tokenProvider(&fetched, &error) || fetched.isEmpty()) {
            if (!error.isEmpty()) {
                qWarning() << "CredentialResolver: Failed to get token:" << error;
            }
            return false;
        }
        m_cachedToken = fetched;
    }
    if (token) *token = m_cachedToken;
    return true;
}

quint16 CredentialResolver::resolvePort() {
    if (m_cachedPort != 0) {
        return m_cachedPort;
    }
    if (m_portProvider) {
        quint16 port = 0;
        QString error;
        if (m_portProvider(&port, &error) && port != 0) {
            m_cachedPort = port;
            return m_cachedPort;
        }
        qWarning() << "CredentialResolver: Failed to get port:" << error << "- using" << DEFAULT_ENGINE_PORT;
    }
    return DEFAULT_ENGINE_PORT;
}

void CredentialResolver::invalidateToken() {
    if (m_cachedToken.isEmpty()) return;
    m_cachedToken.clear();
    qDebug() << "CredentialResolver: Cached token invalidated";
    emit tokenInvalidated();
}

void CredentialResolver::invalidateAll() {
    invalidateToken();
    m_cachedPort = 0;
}
