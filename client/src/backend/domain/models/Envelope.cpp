#include "backend/domain/models/Envelope.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QHash>
#include <QtGlobal>

namespace {
const QHash<QString, EnvelopeType>& typeTable() {
    static const QHash<QString, EnvelopeType> kTypes = {
        { QStringLiteral("heartbeat"), EnvelopeType::Heartbeat },
        { QStringLiteral("pong"), EnvelopeType::Pong },
        { QStringLiteral("auth_success"), EnvelopeType::AuthSuccess },
        { QStringLiteral("model_download_progress"), EnvelopeType::ModelDownloadProgress },
        { QStringLiteral("model_download_complete"), EnvelopeType::ModelDownloadComplete },
        { QStringLiteral("model_download_error"), EnvelopeType::ModelDownloadError },
        { QStringLiteral("scan_progress"), EnvelopeType::ScanProgress },
        { QStringLiteral("scan_complete"), EnvelopeType::ScanComplete },
        { QStringLiteral("job_progress"), EnvelopeType::JobProgress },
        { QStringLiteral("job_complete"), EnvelopeType::JobComplete },
        { QStringLiteral("job_failed"), EnvelopeType::JobFailed }
    };
    return kTypes;
}

void setFailure(bool* ok, QString* errorString, const QString& message) {
    if (ok) *ok = false;
    if (errorString) *errorString = message;
}
}

Envelope::Envelope() = default;

bool Envelope::typeFromString(const QString& name, EnvelopeType* type) {
    const auto& table = typeTable();
    auto it = table.constFind(name);
    if (it == table.constEnd()) return false;
    if (type) *type = it.value();
    return true;
}

QString Envelope::typeToString(EnvelopeType type) {
    const auto& table = typeTable();
    for (auto it = table.constBegin(); it != table.constEnd(); ++it) {
        if (it.value() == type) return it.key();
    }
    return QString();
}

Envelope Envelope::fromText(const QString& text, bool* ok, QString* errorString) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setFailure(ok, errorString, parseError.errorString());
        return Envelope();
    }
    if (!doc.isObject()) {
        setFailure(ok, errorString, QStringLiteral("frame is not a JSON object"));
        return Envelope();
    }
    return fromJson(doc.object(), ok, errorString);
}

Envelope Envelope::fromJson(const QJsonObject& json, bool* ok, QString* errorString) {
    Envelope env;
    const QString typeName = json.value("type").toString();
    if (typeName.isEmpty()) {
        setFailure(ok, errorString, QStringLiteral("missing type"));
        return Envelope();
    }
    if (!typeFromString(typeName, &env.m_type)) {
        setFailure(ok, errorString, QStringLiteral("unknown type: %1").arg(typeName));
        return Envelope();
    }
    env.m_raw = json;

    if (json.contains("progress") && json.value("progress").isDouble()) {
        env.m_progress = qBound(0.0, json.value("progress").toDouble(), 1.0);
        env.m_hasProgress = true;
    }

    if (env.isDownloadTopic()) {
        env.m_model = json.value("model").toString();
        env.m_bytesDownloaded = static_cast<qint64>(json.value("bytes_downloaded").toDouble());
        env.m_bytesTotal = static_cast<qint64>(json.value("bytes_total").toDouble());
        env.m_error = json.value("error").toString();
    } else if (env.isScanTopic()) {
        env.m_libraryId = json.value("library_id").toString();
        env.m_filesFound = json.value("files_found").toInt();
        env.m_filesNew = json.value("files_new").toInt();
        env.m_filesChanged = json.value("files_changed").toInt();
        env.m_filesDeleted = json.value("files_deleted").toInt();
    } else if (env.isJobTopic()) {
        env.m_jobId = json.value("job_id").toString();
        env.m_videoId = json.value("video_id").toString();
        env.m_stage = json.value("stage").toString();
        env.m_message = json.value("message").toString();
        env.m_errorCode = json.value("error_code").toString();
        env.m_errorMessage = json.value("error_message").toString();
    }

    if (!env.isTransportLevel() && env.entityId().isEmpty()) {
        setFailure(ok, errorString, QStringLiteral("%1 frame without entity id").arg(typeName));
        return Envelope();
    }

    if (ok) *ok = true;
    return env;
}

bool Envelope::isTransportLevel() const {
    return m_type == EnvelopeType::Heartbeat
        || m_type == EnvelopeType::Pong
        || m_type == EnvelopeType::AuthSuccess;
}

bool Envelope::isDownloadTopic() const {
    return m_type == EnvelopeType::ModelDownloadProgress
        || m_type == EnvelopeType::ModelDownloadComplete
        || m_type == EnvelopeType::ModelDownloadError;
}

bool Envelope::isScanTopic() const {
    return m_type == EnvelopeType::ScanProgress || m_type == EnvelopeType::ScanComplete;
}

bool Envelope::isJobTopic() const {
    return m_type == EnvelopeType::JobProgress
        || m_type == EnvelopeType::JobComplete
        || m_type == EnvelopeType::JobFailed;
}

QString Envelope::entityId() const {
    if (isDownloadTopic()) return m_model;
    if (isScanTopic()) return m_libraryId;
    if (isJobTopic()) return m_jobId;
    return QString();
}
