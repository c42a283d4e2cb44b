#ifndef SNAPSHOTRECONCILER_H
#define SNAPSHOTRECONCILER_H

#include <QObject>
#include <QPointer>
#include <QString>
#include "backend/domain/models/Envelope.h"

class ISnapshotSource;
class ScanProgressReducer;
class JobProgressReducer;

/**
 * @brief Binds reducer transitions to snapshot side effects
 *
 * - scan_complete for the displayed library (or while "All Libraries" is
 *   displayed) refetches the library list and the video list once
 * - scan_complete for another library refreshes only the library list
 * - job transitions patch the matching item of the held video collection
 * - every freshly fetched collection is patched with the latest job state
 */
class SnapshotReconciler : public QObject {
    Q_OBJECT

public:
    SnapshotReconciler(ISnapshotSource* source, ScanProgressReducer* scans, JobProgressReducer* jobs, QObject* parent = nullptr);
    ~SnapshotReconciler() override = default;

    int refetchCount() const { return m_refetchCount; }

signals:
    void refetchTriggered(const QString& libraryId);
    void itemReconciled(const QString& videoId);

private slots:
    void onScanCompleted(const QString& libraryId);
    void onJobTransition(const Envelope& envelope);
    void onCollectionReset();

private:
    QPointer<ISnapshotSource> m_source;
    QPointer<JobProgressReducer> m_jobs;
    int m_refetchCount = 0;
};

#endif // SNAPSHOTRECONCILER_H
