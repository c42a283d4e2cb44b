#ifndef PROGRESSREDUCER_H
#define PROGRESSREDUCER_H

#include <QObject>
#include <QHash>
#include <QString>
#include <QStringList>
#include "backend/domain/models/Envelope.h"
#include "backend/network/EventRouter.h"

/**
 * @brief Base for the per-topic projections fed by the EventRouter
 *
 * A reducer keeps at most one entry per entity id, always the latest envelope
 * seen for that id. Subclasses decide which envelopes they accept and whether
 * a terminal envelope removes or replaces the entry.
 */
class ProgressReducer : public QObject {
    Q_OBJECT

public:
    explicit ProgressReducer(QObject* parent = nullptr);
    ~ProgressReducer() override;

    // Subscribes apply() to the router; a second attach() replaces the first
    void attach(EventRouter* router);
    void detach();
    bool isAttached() const { return static_cast<bool>(m_unsubscribe); }

    /**
     * @brief Fold one envelope into the projection
     * @return true when the projection changed
     */
    virtual bool apply(const Envelope& envelope) = 0;

    bool contains(const QString& entityId) const { return m_entries.contains(entityId); }
    Envelope entry(const QString& entityId) const { return m_entries.value(entityId); }
    QHash<QString, Envelope> entries() const { return m_entries; }
    QStringList entityIds() const { return m_entries.keys(); }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    // Drops every entry; used when the enabling condition turns off
    virtual void clear();

signals:
    void entryUpdated(const QString& entityId, const Envelope& envelope);
    void entryRemoved(const QString& entityId);
    void cleared();

protected:
    void upsert(const Envelope& envelope);
    bool remove(const QString& entityId);

    QHash<QString, Envelope> m_entries;

private:
    EventRouter::Unsubscribe m_unsubscribe;
};

#endif // PROGRESSREDUCER_H
