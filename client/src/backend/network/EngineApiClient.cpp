#include "backend/network/EngineApiClient.h"
#include "backend/network/CredentialResolver.h"
#include <QJsonParseError>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QUrl>
#include <QDebug>

EngineApiClient::EngineApiClient(CredentialResolver* credentials, QObject* parent)
    : QObject(parent)
    , m_credentials(credentials)
{
    Q_ASSERT(m_credentials);
}

QString EngineApiClient::baseUrl() const {
    return QString("http://127.0.0.1:%1").arg(m_credentials->resolvePort());
}

void EngineApiClient::get(const QString& endpoint, ResultCallback callback) {
    ApiRequest request;
    request.endpoint = endpoint;
    send(request, std::move(callback));
}

void EngineApiClient::postJson(const QString& endpoint, const QJsonObject& body, ResultCallback callback) {
    ApiRequest request;
    request.method = "POST";
    request.endpoint = endpoint;
    request.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    send(request, std::move(callback));
}

void EngineApiClient::send(const ApiRequest& request, ResultCallback callback) {
    sendAttempt(request, std::move(callback), 0);
}

void EngineApiClient::sendAttempt(const ApiRequest& request, ResultCallback callback, int attempt) {
    QNetworkRequest req{QUrl(baseUrl() + request.endpoint)};
    req.setTransferTimeout(m_transferTimeoutMs);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it) {
        req.setRawHeader(it.key(), it.value());
    }
    if (!request.contentType.isEmpty()) {
        req.setRawHeader("Content-Type", request.contentType);
    } else if (!request.formData && !request.headers.contains("Content-Type")) {
        req.setRawHeader("Content-Type", "application/json");
    }

    QString token;
    if (m_credentials->resolveToken(&token)) {
        req.setRawHeader("Authorization", "Bearer " + token.toUtf8());
    }

    ++m_requestsSent;
    QNetworkReply* reply = m_net.sendCustomRequest(req, request.method, request.body);

    QPointer<EngineApiClient> self(this);
    connect(reply, &QNetworkReply::finished, this, [self, reply, request, callback, attempt]() {
        reply->deleteLater();
        if (!self) return;

        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status == 401 && attempt == 0) {
            qDebug() << "EngineApiClient: 401 on" << request.endpoint << "- refreshing token and retrying once";
            self->m_credentials->invalidateToken();
            self->sendAttempt(request, callback, attempt + 1);
            return;
        }

        const ApiResult result = self->buildResult(reply, attempt);
        if (!result.ok) {
            qWarning() << "EngineApiClient:" << request.method << request.endpoint << "failed:" << result.errorString;
        }
        if (callback) callback(result);
    });
}

ApiResult EngineApiClient::buildResult(QNetworkReply* reply, int attempt) const {
    ApiResult result;
    result.attempts = attempt + 1;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    const QByteArray body = reply->readAll();
    const bool success = result.statusCode >= 200 && result.statusCode < 300;

    if (!success) {
        QString detail = QString::fromUtf8(body);
        if (detail.isEmpty()) {
            detail = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        }
        if (detail.isEmpty()) {
            detail = reply->errorString();
        }
        result.text = QString::fromUtf8(body);
        result.errorString = QString("API request failed: %1 %2").arg(result.statusCode).arg(detail);
        return result;
    }

    const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();
    if (contentType.contains("application/json", Qt::CaseInsensitive)) {
        QJsonParseError parseError;
        result.json = QJsonDocument::fromJson(body, &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            result.errorString = QString("API response is not valid JSON: %1").arg(parseError.errorString());
            result.text = QString::fromUtf8(body);
            return result;
        }
        result.isJson = true;
    } else {
        result.text = QString::fromUtf8(body);
    }
    result.ok = true;
    return result;
}
