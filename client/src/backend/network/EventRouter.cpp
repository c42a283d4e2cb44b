#include "backend/network/EventRouter.h"
#include <QPointer>
#include <QDebug>
#include <exception>

EventRouter::EventRouter(QObject* parent)
    : QObject(parent)
{
}

EventRouter::Unsubscribe EventRouter::addHandler(Handler handler) {
    const HandlerId id = registerHandler(std::move(handler));
    QPointer<EventRouter> self(this);
    return [self, id]() {
        if (self) self->removeHandler(id);
    };
}

EventRouter::HandlerId EventRouter::registerHandler(Handler handler) {
    if (!handler) {
        qWarning() << "EventRouter: Ignoring empty handler";
        return 0;
    }
    const HandlerId id = m_nextId++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

bool EventRouter::removeHandler(HandlerId id) {
    return m_handlers.erase(id) > 0;
}

void EventRouter::dispatch(const Envelope& envelope) {
    if (m_handlers.empty()) return;

    const std::map<HandlerId, Handler> snapshot = m_handlers;
    for (const auto& entry : snapshot) {
        if (m_handlers.find(entry.first) == m_handlers.end()) {
            continue; // unsubscribed earlier in this pass
        }
        try {
            entry.second(envelope);
        } catch (const std::exception& e) {
            qWarning() << "EventRouter: Handler" << entry.first << "threw on" << envelope.typeName() << ":" << e.what();
        } catch (...) {
            qWarning() << "EventRouter: Handler" << entry.first << "threw a non-standard exception on" << envelope.typeName();
        }
    }
}
