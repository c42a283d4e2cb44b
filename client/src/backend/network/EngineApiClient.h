#ifndef ENGINEAPICLIENT_H
#define ENGINEAPICLIENT_H

#include <QObject>
#include <QByteArray>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>
#include <functional>

class CredentialResolver;
class QNetworkReply;

struct ApiRequest {
    QByteArray method = "GET";
    QString endpoint;                       // path plus optional query, e.g. "/videos?library_id=abc"
    QByteArray body;
    bool formData = false;                  // multipart body: no JSON content type is forced
    QByteArray contentType;                 // overrides application/json when set
    QHash<QByteArray, QByteArray> headers;
};

struct ApiResult {
    bool ok = false;
    int statusCode = 0;                     // 0 when the engine was unreachable
    bool isJson = false;
    QJsonDocument json;
    QString text;
    QString errorString;
    int attempts = 0;
};

/**
 * @brief Request/response client for the engine's HTTP API
 *
 * Resolves port and token through the shared CredentialResolver and attaches
 * "Authorization: Bearer <token>" when a token exists. A 401 invalidates the
 * cached token and the request is sent exactly once more with a freshly
 * resolved token; any other failure, or a second 401, is reported as is.
 */
class EngineApiClient : public QObject {
    Q_OBJECT

public:
    using ResultCallback = std::function<void(const ApiResult&)>;

    static constexpr int DEFAULT_TRANSFER_TIMEOUT_MS = 30000;

    explicit EngineApiClient(CredentialResolver* credentials, QObject* parent = nullptr);
    ~EngineApiClient() override = default;

    void setTransferTimeout(int timeoutMs) { m_transferTimeoutMs = timeoutMs; }

    QString baseUrl() const;

    void send(const ApiRequest& request, ResultCallback callback);
    void get(const QString& endpoint, ResultCallback callback);
    void postJson(const QString& endpoint, const QJsonObject& body, ResultCallback callback);

    int requestsSent() const { return m_requestsSent; }

private:
    void sendAttempt(const ApiRequest& request, ResultCallback callback, int attempt);
    ApiResult buildResult(QNetworkReply* reply, int attempt) const;

    CredentialResolver* m_credentials;
    QNetworkAccessManager m_net;
    int m_transferTimeoutMs = DEFAULT_TRANSFER_TIMEOUT_MS;
    int m_requestsSent = 0;
};

#endif // ENGINEAPICLIENT_H
