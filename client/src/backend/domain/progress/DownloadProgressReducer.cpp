#include "backend/domain/progress/DownloadProgressReducer.h"
#include <QDebug>
#include <algorithm>

DownloadProgressReducer::DownloadProgressReducer(QObject* parent)
    : ProgressReducer(parent)
    , m_watchdog(new QTimer(this))
{
    m_clock.start();
    connect(m_watchdog, &QTimer::timeout, this, &DownloadProgressReducer::checkForStalls);
    setStallTimeout(DEFAULT_STALL_TIMEOUT_MS);
}

void DownloadProgressReducer::setStallTimeout(int timeoutMs) {
    m_stallTimeoutMs = std::max(timeoutMs, 1);
    // Check often enough that a stall is reported within 1.25x the timeout
    m_watchdog->setInterval(std::max(m_stallTimeoutMs / 4, 1));
}

bool DownloadProgressReducer::apply(const Envelope& envelope) {
    switch (envelope.type()) {
        case EnvelopeType::ModelDownloadProgress: {
            const QString model = envelope.model();
            m_lastUpdateMs.insert(model, m_clock.elapsed());
            m_outcomes.insert(model, DownloadOutcome::InProgress);
            m_failureReasons.remove(model);
            upsert(envelope);
            updateWatchdog();
            return true;
        }
        case EnvelopeType::ModelDownloadComplete:
            finish(envelope.model(), DownloadOutcome::Completed);
            return true;
        case EnvelopeType::ModelDownloadError:
            finish(envelope.model(), DownloadOutcome::Failed,
                   envelope.error().isEmpty() ? QStringLiteral("download error") : envelope.error());
            return true;
        default:
            return false;
    }
}

void DownloadProgressReducer::clear() {
    m_outcomes.clear();
    m_failureReasons.clear();
    m_lastUpdateMs.clear();
    m_watchdog->stop();
    ProgressReducer::clear();
}

DownloadOutcome DownloadProgressReducer::outcome(const QString& model) const {
    return m_outcomes.value(model, DownloadOutcome::Unknown);
}

void DownloadProgressReducer::finish(const QString& model, DownloadOutcome outcome, const QString& reason) {
    m_lastUpdateMs.remove(model);
    m_outcomes.insert(model, outcome);
    remove(model);
    updateWatchdog();

    if (outcome == DownloadOutcome::Completed) {
        m_failureReasons.remove(model);
        qDebug() << "DownloadProgressReducer: Model" << model << "downloaded";
        emit downloadCompleted(model);
    } else {
        m_failureReasons.insert(model, reason);
        qWarning() << "DownloadProgressReducer: Model" << model << "failed:" << reason;
        emit downloadFailed(model, reason);
    }
}

void DownloadProgressReducer::checkForStalls() {
    const qint64 now = m_clock.elapsed();
    QStringList stalled;
    for (auto it = m_lastUpdateMs.constBegin(); it != m_lastUpdateMs.constEnd(); ++it) {
        if (now - it.value() >= m_stallTimeoutMs) {
            stalled.append(it.key());
        }
    }
    for (const QString& model : stalled) {
        finish(model, DownloadOutcome::Failed,
               QString("stalled: no progress for %1 ms").arg(m_stallTimeoutMs));
    }
}

void DownloadProgressReducer::updateWatchdog() {
    if (m_lastUpdateMs.isEmpty()) {
        m_watchdog->stop();
    } else if (!m_watchdog->isActive()) {
        m_watchdog->start();
    }
}
