#ifndef ISNAPSHOTSOURCE_H
#define ISNAPSHOTSOURCE_H

#include <QObject>
#include <QString>

class VideoCollection;

// Pull-side state the reconciler refreshes and patches
class ISnapshotSource : public QObject {
    Q_OBJECT

public:
    explicit ISnapshotSource(QObject* parent = nullptr) : QObject(parent) {}
    ~ISnapshotSource() override = default;

    virtual QString selectedLibraryId() const = 0;
    virtual VideoCollection* videos() = 0;

    virtual void fetchLibraries() = 0;
    virtual void fetchVideos(const QString& libraryId) = 0;
};

#endif // ISNAPSHOTSOURCE_H
