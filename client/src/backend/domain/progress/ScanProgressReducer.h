#ifndef SCANPROGRESSREDUCER_H
#define SCANPROGRESSREDUCER_H

#include "backend/domain/progress/ProgressReducer.h"

// Library scans keyed by library_id; the entry holds scan_progress or scan_complete
// and is never removed.
class ScanProgressReducer : public ProgressReducer {
    Q_OBJECT

public:
    explicit ScanProgressReducer(QObject* parent = nullptr);
    ~ScanProgressReducer() override = default;

    bool apply(const Envelope& envelope) override;

    bool isScanning(const QString& libraryId) const;
    bool hasCompleted(const QString& libraryId) const;

signals:
    // Emitted once per scan_complete envelope, after the entry is replaced
    void scanCompleted(const QString& libraryId, const Envelope& envelope);
};

#endif // SCANPROGRESSREDUCER_H
