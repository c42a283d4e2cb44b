#ifndef SNAPSHOTFETCHER_H
#define SNAPSHOTFETCHER_H

#include "backend/services/ISnapshotSource.h"
#include "backend/domain/models/CatalogInfo.h"
#include <QList>

class EngineApiClient;
class VideoCollection;
struct ApiResult;

/**
 * @brief Fetches library and video snapshots from the engine
 *
 * Owns the authoritative library list (prefixed with the "All Libraries"
 * aggregate) and the VideoCollection for the selected library. Each fetch
 * replaces its collection wholesale; a response that arrives after a newer
 * request was issued is discarded.
 */
class SnapshotFetcher : public ISnapshotSource {
    Q_OBJECT

public:
    explicit SnapshotFetcher(EngineApiClient* api, QObject* parent = nullptr);
    ~SnapshotFetcher() override = default;

    QString selectedLibraryId() const override { return m_selectedLibraryId; }
    VideoCollection* videos() override { return m_videos; }
    const VideoCollection* videos() const { return m_videos; }
    QList<LibraryInfo> libraries() const { return m_libraries; }

    void setSelectedLibrary(const QString& libraryId);
    // Records a selection to use on the next refresh() without fetching now
    void setInitialLibrary(const QString& libraryId) { m_selectedLibraryId = libraryId; }

    void fetchLibraries() override;
    void fetchVideos(const QString& libraryId) override;
    // Library list plus the selected library's videos
    void refresh();

    static QString videosEndpoint(const QString& libraryId);

signals:
    void librariesChanged(const QList<LibraryInfo>& libraries);
    void selectedLibraryChanged(const QString& libraryId);
    void videosFetched(const QString& libraryId, int count);
    void fetchFailed(const QString& what, const QString& errorString);

private:
    void handleLibraries(const ApiResult& result, quint64 generation);
    void handleVideos(const ApiResult& result, const QString& libraryId, quint64 generation);

    EngineApiClient* m_api;
    VideoCollection* m_videos;
    QList<LibraryInfo> m_libraries;
    QString m_selectedLibraryId;
    quint64 m_librariesGeneration = 0;
    quint64 m_videosGeneration = 0;
};

#endif // SNAPSHOTFETCHER_H
