#ifndef ENVELOPE_H
#define ENVELOPE_H

#include <QString>
#include <QJsonObject>
#include <QMetaType>

// Discriminant of a push-channel frame. Closed set: anything else fails to decode.
enum class EnvelopeType {
    Heartbeat,
    Pong,
    AuthSuccess,
    ModelDownloadProgress,
    ModelDownloadComplete,
    ModelDownloadError,
    ScanProgress,
    ScanComplete,
    JobProgress,
    JobComplete,
    JobFailed
};

/**
 * @brief One decoded push-channel message
 *
 * Envelopes are immutable once decoded. Payload accessors return defaults
 * (empty string, 0) for fields the type does not carry.
 */
class Envelope {
public:
    Envelope();

    static Envelope fromJson(const QJsonObject& json, bool* ok = nullptr, QString* errorString = nullptr);
    static Envelope fromText(const QString& text, bool* ok = nullptr, QString* errorString = nullptr);
    QJsonObject toJson() const { return m_raw; }

    static bool typeFromString(const QString& name, EnvelopeType* type);
    static QString typeToString(EnvelopeType type);

    EnvelopeType type() const { return m_type; }
    QString typeName() const { return typeToString(m_type); }

    // Heartbeat, pong and auth_success are consumed by the connection layer
    bool isTransportLevel() const;
    bool isDownloadTopic() const;
    bool isScanTopic() const;
    bool isJobTopic() const;

    // Key of the projection entry this envelope updates (model, library_id or job_id)
    QString entityId() const;

    // model_download_*
    QString model() const { return m_model; }
    qint64 bytesDownloaded() const { return m_bytesDownloaded; }
    qint64 bytesTotal() const { return m_bytesTotal; }
    QString error() const { return m_error; }

    // scan_*
    QString libraryId() const { return m_libraryId; }
    int filesFound() const { return m_filesFound; }
    int filesNew() const { return m_filesNew; }
    int filesChanged() const { return m_filesChanged; }
    int filesDeleted() const { return m_filesDeleted; }

    // job_*
    QString jobId() const { return m_jobId; }
    QString videoId() const { return m_videoId; }
    QString stage() const { return m_stage; }
    QString message() const { return m_message; }
    QString errorCode() const { return m_errorCode; }
    QString errorMessage() const { return m_errorMessage; }

    // Progress in [0,1]; hasProgress() is false when the frame omitted it
    double progress() const { return m_progress; }
    bool hasProgress() const { return m_hasProgress; }

    bool operator==(const Envelope& other) const { return m_type == other.m_type && m_raw == other.m_raw; }
    bool operator!=(const Envelope& other) const { return !(*this == other); }

private:
    EnvelopeType m_type = EnvelopeType::Heartbeat;
    QJsonObject m_raw;

    QString m_model;
    qint64 m_bytesDownloaded = 0;
    qint64 m_bytesTotal = 0;
    QString m_error;

    QString m_libraryId;
    int m_filesFound = 0;
    int m_filesNew = 0;
    int m_filesChanged = 0;
    int m_filesDeleted = 0;

    QString m_jobId;
    QString m_videoId;
    QString m_stage;
    QString m_message;
    QString m_errorCode;
    QString m_errorMessage;

    double m_progress = 0.0;
    bool m_hasProgress = false;
};

Q_DECLARE_METATYPE(Envelope)

#endif // ENVELOPE_H
