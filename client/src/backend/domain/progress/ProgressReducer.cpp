#include "backend/domain/progress/ProgressReducer.h"
#include <QPointer>

ProgressReducer::ProgressReducer(QObject* parent)
    : QObject(parent)
{
}

ProgressReducer::~ProgressReducer() {
    detach();
}

void ProgressReducer::attach(EventRouter* router) {
    detach();
    if (!router) return;
    QPointer<ProgressReducer> self(this);
    m_unsubscribe = router->addHandler([self](const Envelope& envelope) {
        if (self) self->apply(envelope);
    });
}

void ProgressReducer::detach() {
    if (m_unsubscribe) {
        m_unsubscribe();
        m_unsubscribe = nullptr;
    }
}

void ProgressReducer::clear() {
    if (m_entries.isEmpty()) return;
    m_entries.clear();
    emit cleared();
}

void ProgressReducer::upsert(const Envelope& envelope) {
    const QString id = envelope.entityId();
    m_entries.insert(id, envelope);
    emit entryUpdated(id, envelope);
}

bool ProgressReducer::remove(const QString& entityId) {
    if (m_entries.remove(entityId) == 0) return false;
    emit entryRemoved(entityId);
    return true;
}
