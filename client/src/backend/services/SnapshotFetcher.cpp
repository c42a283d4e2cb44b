#include "backend/services/SnapshotFetcher.h"
#include "backend/domain/catalog/VideoCollection.h"
#include "backend/network/EngineApiClient.h"
#include <QJsonArray>
#include <QPointer>
#include <QUrl>
#include <QDebug>

SnapshotFetcher::SnapshotFetcher(EngineApiClient* api, QObject* parent)
    : ISnapshotSource(parent)
    , m_api(api)
    , m_videos(new VideoCollection(this))
{
    Q_ASSERT(m_api);
}

QString SnapshotFetcher::videosEndpoint(const QString& libraryId) {
    if (libraryId.isEmpty() || libraryId == ALL_LIBRARIES_ID) {
        return QStringLiteral("/videos");
    }
    return QStringLiteral("/videos?library_id=") + QString::fromLatin1(QUrl::toPercentEncoding(libraryId));
}

void SnapshotFetcher::setSelectedLibrary(const QString& libraryId) {
    if (m_selectedLibraryId == libraryId) return;
    m_selectedLibraryId = libraryId;
    qDebug() << "SnapshotFetcher: Selected library" << libraryId;
    emit selectedLibraryChanged(libraryId);

    if (libraryId.isEmpty()) {
        ++m_videosGeneration; // late responses for the old selection are dropped
        m_videos->clear();
    } else {
        fetchVideos(libraryId);
    }
}

void SnapshotFetcher::refresh() {
    fetchLibraries();
    if (!m_selectedLibraryId.isEmpty()) {
        fetchVideos(m_selectedLibraryId);
    }
}

void SnapshotFetcher::fetchLibraries() {
    const quint64 generation = ++m_librariesGeneration;
    QPointer<SnapshotFetcher> self(this);
    m_api->get(QStringLiteral("/libraries"), [self, generation](const ApiResult& result) {
        if (self) self->handleLibraries(result, generation);
    });
}

void SnapshotFetcher::fetchVideos(const QString& libraryId) {
    if (libraryId.isEmpty()) return;
    const quint64 generation = ++m_videosGeneration;
    QPointer<SnapshotFetcher> self(this);
    m_api->get(videosEndpoint(libraryId), [self, libraryId, generation](const ApiResult& result) {
        if (self) self->handleVideos(result, libraryId, generation);
    });
}

void SnapshotFetcher::handleLibraries(const ApiResult& result, quint64 generation) {
    if (generation != m_librariesGeneration) {
        qDebug() << "SnapshotFetcher: Dropping stale library list";
        return;
    }
    if (!result.ok) {
        qWarning() << "SnapshotFetcher: Failed to fetch libraries:" << result.errorString;
        emit fetchFailed(QStringLiteral("libraries"), result.errorString);
        return;
    }

    QList<LibraryInfo> libs;
    const QJsonArray arr = result.json.object().value("libraries").toArray();
    for (const auto& v : arr) {
        libs.append(LibraryInfo::fromJson(v.toObject()));
    }

    QList<LibraryInfo> next = libs;
    if (!libs.isEmpty()) {
        next.prepend(makeAggregateLibrary(libs));
    }
    m_libraries = next;
    emit librariesChanged(m_libraries);

    if (m_libraries.isEmpty()) {
        setSelectedLibrary(QString());
        return;
    }
    bool selectionPresent = false;
    for (const auto& lib : m_libraries) {
        if (lib.libraryId == m_selectedLibraryId) {
            selectionPresent = true;
            break;
        }
    }
    if (!selectionPresent) {
        setSelectedLibrary(m_libraries.first().libraryId);
    }
}

void SnapshotFetcher::handleVideos(const ApiResult& result, const QString& libraryId, quint64 generation) {
    if (generation != m_videosGeneration || libraryId != m_selectedLibraryId) {
        qDebug() << "SnapshotFetcher: Dropping stale video list for" << libraryId;
        return;
    }
    if (!result.ok) {
        qWarning() << "SnapshotFetcher: Failed to fetch videos:" << result.errorString;
        emit fetchFailed(QStringLiteral("videos"), result.errorString);
        return;
    }

    QList<VideoInfo> videos;
    const QJsonArray arr = result.json.object().value("videos").toArray();
    videos.reserve(arr.size());
    for (const auto& v : arr) {
        videos.append(VideoInfo::fromJson(v.toObject()));
    }
    m_videos->replaceAll(videos, libraryId);
    emit videosFetched(libraryId, videos.size());
}
