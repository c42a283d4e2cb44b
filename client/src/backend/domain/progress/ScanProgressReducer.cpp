#include "backend/domain/progress/ScanProgressReducer.h"
#include <QDebug>

ScanProgressReducer::ScanProgressReducer(QObject* parent)
    : ProgressReducer(parent)
{
}

bool ScanProgressReducer::apply(const Envelope& envelope) {
    if (!envelope.isScanTopic()) {
        return false;
    }
    upsert(envelope);
    if (envelope.type() == EnvelopeType::ScanComplete) {
        qDebug() << "ScanProgressReducer: Scan complete for library" << envelope.libraryId()
                 << "found" << envelope.filesFound() << "new" << envelope.filesNew();
        emit scanCompleted(envelope.libraryId(), envelope);
    }
    return true;
}

bool ScanProgressReducer::isScanning(const QString& libraryId) const {
    auto it = m_entries.constFind(libraryId);
    return it != m_entries.constEnd() && it.value().type() == EnvelopeType::ScanProgress;
}

bool ScanProgressReducer::hasCompleted(const QString& libraryId) const {
    auto it = m_entries.constFind(libraryId);
    return it != m_entries.constEnd() && it.value().type() == EnvelopeType::ScanComplete;
}
