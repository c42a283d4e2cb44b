#ifndef VIDEOCOLLECTION_H
#define VIDEOCOLLECTION_H

#include <QObject>
#include <QHash>
#include <QList>
#include <QString>
#include "backend/domain/models/CatalogInfo.h"
#include "backend/domain/models/Envelope.h"

inline const QString VIDEO_STATUS_DONE = QStringLiteral("DONE");
inline const QString VIDEO_STATUS_FAILED = QStringLiteral("FAILED");

/**
 * @brief The video list held by the pull path
 *
 * Items only enter through replaceAll(), i.e. a full snapshot fetch. Push
 * events can patch the status/progress of an item already present but never
 * add or remove one.
 */
class VideoCollection : public QObject {
    Q_OBJECT

public:
    explicit VideoCollection(QObject* parent = nullptr);
    ~VideoCollection() override = default;

    void replaceAll(const QList<VideoInfo>& videos, const QString& libraryId);
    void clear();

    QList<VideoInfo> items() const { return m_items; }
    int size() const { return m_items.size(); }
    bool isEmpty() const { return m_items.isEmpty(); }
    QString libraryId() const { return m_libraryId; }

    int indexOf(const QString& videoId) const { return m_indexById.value(videoId, -1); }
    bool contains(const QString& videoId) const { return m_indexById.contains(videoId); }
    VideoInfo item(const QString& videoId) const;

    /**
     * @brief Patch the item targeted by a job envelope
     * @return true when an item changed; unknown video ids are ignored
     */
    bool applyJobEnvelope(const Envelope& envelope);

signals:
    void collectionReset();
    void itemPatched(int index, const VideoInfo& video);

private:
    void rebuildIndex();

    QList<VideoInfo> m_items;
    QHash<QString, int> m_indexById;
    QString m_libraryId;
};

#endif // VIDEOCOLLECTION_H
