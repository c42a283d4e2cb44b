#ifndef CREDENTIALRESOLVER_H
#define CREDENTIALRESOLVER_H

#include <QObject>
#include <QString>
#include <functional>

/**
 * @brief Supplies the engine bearer token and port, caching both
 *
 * The resolver is shared by the push and pull paths. Values are fetched
 * from the injected providers on first use and kept until invalidated.
 * A failed lookup is not cached, so the next call asks the provider again.
 */
class CredentialResolver : public QObject {
    Q_OBJECT

public:
    using TokenProvider = std::function<bool(QString* token, QString* errorString)>;
    using PortProvider = std::function<bool(quint16* port, QString* errorString)>;

    static constexpr quint16 DEFAULT_ENGINE_PORT = 48100;

    explicit CredentialResolver(QObject* parent = nullptr);
    CredentialResolver(TokenProvider tokenProvider, PortProvider portProvider, QObject* parent = nullptr);
    ~CredentialResolver() override = default;

    void setTokenProvider(TokenProvider provider) { m_tokenProvider = std::move(provider); }
    void setPortProvider(PortProvider provider) { m_portProvider = std::move(provider); }

    /**
     * @brief Resolve the bearer token
     * @param token Receives the token on success
     * @return false when no token is available (unauthenticated mode)
     */
    bool resolveToken(QString* token);

    /**
     * @brief Resolve the engine port, falling back to DEFAULT_ENGINE_PORT
     */
    quint16 resolvePort();

    bool hasCachedToken() const { return !m_cachedToken.isEmpty(); }
    bool hasCachedPort() const { return m_cachedPort != 0; }

    // Idempotent: clearing an empty cache is a no-op
    void invalidateToken();
    void invalidateAll();

signals:
    void tokenInvalidated();

private:
    TokenProvider m_tokenProvider;
    PortProvider m_portProvider;
    QString m_cachedToken;
    quint16 m_cachedPort = 0;
};

#endif // CREDENTIALRESOLVER_H
