#include "backend/domain/progress/JobProgressReducer.h"

JobProgressReducer::JobProgressReducer(QObject* parent)
    : ProgressReducer(parent)
{
}

bool JobProgressReducer::apply(const Envelope& envelope) {
    if (!envelope.isJobTopic()) {
        return false;
    }
    if (!envelope.videoId().isEmpty()) {
        m_latestJobByVideo.insert(envelope.videoId(), envelope.jobId());
    }
    upsert(envelope);
    emit jobTransition(envelope);
    return true;
}

void JobProgressReducer::clear() {
    m_latestJobByVideo.clear();
    ProgressReducer::clear();
}

bool JobProgressReducer::latestForVideo(const QString& videoId, Envelope* envelope) const {
    auto jobIt = m_latestJobByVideo.constFind(videoId);
    if (jobIt == m_latestJobByVideo.constEnd()) return false;
    auto entryIt = m_entries.constFind(jobIt.value());
    if (entryIt == m_entries.constEnd()) return false;
    if (envelope) *envelope = entryIt.value();
    return true;
}
