#include "backend/domain/catalog/VideoCollection.h"
#include <QDebug>

VideoCollection::VideoCollection(QObject* parent)
    : QObject(parent)
{
}

void VideoCollection::replaceAll(const QList<VideoInfo>& videos, const QString& libraryId) {
    m_items = videos;
    m_libraryId = libraryId;
    rebuildIndex();
    emit collectionReset();
}

void VideoCollection::clear() {
    replaceAll(QList<VideoInfo>(), QString());
}

VideoInfo VideoCollection::item(const QString& videoId) const {
    const int index = indexOf(videoId);
    return index >= 0 ? m_items.at(index) : VideoInfo();
}

bool VideoCollection::applyJobEnvelope(const Envelope& envelope) {
    if (!envelope.isJobTopic()) return false;

    const int index = indexOf(envelope.videoId());
    if (index < 0) {
        return false; // belongs to a library that is not displayed
    }

    VideoInfo patched = m_items.at(index);
    switch (envelope.type()) {
        case EnvelopeType::JobComplete:
            patched.status = VIDEO_STATUS_DONE;
            patched.progress = 1.0;
            break;
        case EnvelopeType::JobProgress:
            if (!envelope.hasProgress()) return false;
            patched.progress = envelope.progress();
            if (!envelope.stage().isEmpty()) patched.status = envelope.stage();
            break;
        case EnvelopeType::JobFailed:
            patched.status = VIDEO_STATUS_FAILED;
            patched.errorCode = envelope.errorCode();
            patched.errorMessage = envelope.errorMessage();
            break;
        default:
            return false;
    }

    if (patched == m_items.at(index)) return false;
    m_items[index] = patched;
    emit itemPatched(index, patched);
    return true;
}

void VideoCollection::rebuildIndex() {
    m_indexById.clear();
    m_indexById.reserve(m_items.size());
    for (int i = 0; i < m_items.size(); ++i) {
        const QString& id = m_items.at(i).videoId;
        if (m_indexById.contains(id)) {
            qWarning() << "VideoCollection: Duplicate video id in snapshot:" << id;
            continue;
        }
        m_indexById.insert(id, i);
    }
}
