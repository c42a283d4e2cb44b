#ifndef DOWNLOADPROGRESSREDUCER_H
#define DOWNLOADPROGRESSREDUCER_H

#include "backend/domain/progress/ProgressReducer.h"
#include <QElapsedTimer>
#include <QTimer>

enum class DownloadOutcome {
    Unknown,        // never seen in this session
    InProgress,
    Completed,      // model_download_complete received
    Failed          // model_download_error received, or the entry stalled
};

/**
 * @brief Projection of model downloads keyed by model name
 *
 * An entry exists only while the model is downloading. Completion is taken
 * from model_download_complete alone; an entry that stops receiving progress
 * for longer than the stall timeout is removed and reported as failed, never
 * as completed.
 */
class DownloadProgressReducer : public ProgressReducer {
    Q_OBJECT

public:
    static constexpr int DEFAULT_STALL_TIMEOUT_MS = 120000;

    explicit DownloadProgressReducer(QObject* parent = nullptr);
    ~DownloadProgressReducer() override = default;

    bool apply(const Envelope& envelope) override;
    void clear() override;

    void setStallTimeout(int timeoutMs);
    int stallTimeout() const { return m_stallTimeoutMs; }

    bool isDownloading(const QString& model) const { return contains(model); }
    DownloadOutcome outcome(const QString& model) const;
    QString failureReason(const QString& model) const { return m_failureReasons.value(model); }

signals:
    void downloadCompleted(const QString& model);
    void downloadFailed(const QString& model, const QString& reason);

private slots:
    void checkForStalls();

private:
    void finish(const QString& model, DownloadOutcome outcome, const QString& reason = QString());
    void updateWatchdog();

    QHash<QString, DownloadOutcome> m_outcomes;
    QHash<QString, QString> m_failureReasons;
    QHash<QString, qint64> m_lastUpdateMs;
    QElapsedTimer m_clock;
    QTimer* m_watchdog;
    int m_stallTimeoutMs = DEFAULT_STALL_TIMEOUT_MS;
};

#endif // DOWNLOADPROGRESSREDUCER_H
