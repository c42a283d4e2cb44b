#include "backend/controllers/SnapshotReconciler.h"
#include "backend/services/ISnapshotSource.h"
#include "backend/domain/catalog/VideoCollection.h"
#include "backend/domain/models/CatalogInfo.h"
#include "backend/domain/progress/ScanProgressReducer.h"
#include "backend/domain/progress/JobProgressReducer.h"
#include <QDebug>

SnapshotReconciler::SnapshotReconciler(ISnapshotSource* source, ScanProgressReducer* scans, JobProgressReducer* jobs, QObject* parent)
    : QObject(parent)
    , m_source(source)
    , m_jobs(jobs)
{
    Q_ASSERT(m_source);
    if (scans) {
        connect(scans, &ScanProgressReducer::scanCompleted, this, &SnapshotReconciler::onScanCompleted);
    }
    if (jobs) {
        connect(jobs, &JobProgressReducer::jobTransition, this, &SnapshotReconciler::onJobTransition);
    }
    if (m_source->videos()) {
        connect(m_source->videos(), &VideoCollection::collectionReset, this, &SnapshotReconciler::onCollectionReset);
    }
}

void SnapshotReconciler::onScanCompleted(const QString& libraryId) {
    if (!m_source) return;
    const QString selected = m_source->selectedLibraryId();

    if (selected == libraryId || selected == ALL_LIBRARIES_ID) {
        qDebug() << "SnapshotReconciler: Scan of" << libraryId << "finished, refetching" << selected;
        ++m_refetchCount;
        m_source->fetchLibraries();
        m_source->fetchVideos(selected);
        emit refetchTriggered(libraryId);
    } else {
        // Counters on the summary list changed even though the displayed list did not
        m_source->fetchLibraries();
    }
}

void SnapshotReconciler::onJobTransition(const Envelope& envelope) {
    if (!m_source || !m_source->videos()) return;
    if (m_source->videos()->applyJobEnvelope(envelope)) {
        emit itemReconciled(envelope.videoId());
    }
}

void SnapshotReconciler::onCollectionReset() {
    if (!m_source || !m_jobs) return;
    VideoCollection* videos = m_source->videos();
    if (!videos) return;

    const QList<VideoInfo> items = videos->items();
    for (const auto& video : items) {
        Envelope latest;
        if (!m_jobs->latestForVideo(video.videoId, &latest)) continue;
        // A fresh snapshot that already reached a terminal status wins over older progress
        if (latest.type() == EnvelopeType::JobProgress
            && (video.status == VIDEO_STATUS_DONE || video.status == VIDEO_STATUS_FAILED)) {
            continue;
        }
        if (videos->applyJobEnvelope(latest)) {
            emit itemReconciled(video.videoId);
        }
    }
}
