#ifndef CATALOGINFO_H
#define CATALOGINFO_H

#include <QString>
#include <QList>
#include <QJsonObject>

// Synthetic library entry aggregating every library on the engine
inline const QString ALL_LIBRARIES_ID = QStringLiteral("__all__");

struct LibraryInfo {
    QString libraryId;
    QString folderPath;
    QString name;
    int videoCount = 0;
    int indexedCount = 0;

    bool isAggregate() const { return libraryId == ALL_LIBRARIES_ID; }

    QJsonObject toJson() const;
    static LibraryInfo fromJson(const QJsonObject& json);

    bool operator==(const LibraryInfo& other) const;
    bool operator!=(const LibraryInfo& other) const { return !(*this == other); }
};

struct VideoInfo {
    QString videoId;
    QString libraryId;
    QString path;
    QString filename;
    qint64 fileSize = -1;       // -1 when the engine did not report it
    qint64 createdAtMs = 0;
    qint64 durationMs = 0;
    QString status;             // QUEUED, PROCESSING, DONE, FAILED or a live stage name
    double progress = 0.0;
    QString thumbnailPath;
    QString errorCode;
    QString errorMessage;

    QJsonObject toJson() const;
    static VideoInfo fromJson(const QJsonObject& json);

    bool operator==(const VideoInfo& other) const;
    bool operator!=(const VideoInfo& other) const { return !(*this == other); }
};

// Builds the "All Libraries" entry whose counters are the sums over libraries
LibraryInfo makeAggregateLibrary(const QList<LibraryInfo>& libraries);

#endif // CATALOGINFO_H
