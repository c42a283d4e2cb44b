#ifndef EVENTROUTER_H
#define EVENTROUTER_H

#include <QObject>
#include <functional>
#include <map>
#include "backend/domain/models/Envelope.h"

/**
 * @brief Fan-out registry for application-level push envelopes
 *
 * Every registered handler receives every dispatched envelope, synchronously
 * and by reference to the same instance. The handler set is copied before each
 * pass so handlers may subscribe or unsubscribe from inside a callback; a
 * handler removed during a pass is skipped for the rest of that pass.
 */
class EventRouter : public QObject {
    Q_OBJECT

public:
    using Handler = std::function<void(const Envelope&)>;
    using HandlerId = quint64;
    using Unsubscribe = std::function<void()>;

    explicit EventRouter(QObject* parent = nullptr);
    ~EventRouter() override = default;

    /**
     * @brief Register a consumer
     * @return Callable that removes the consumer; safe to call more than once
     *         and after the router is destroyed
     */
    Unsubscribe addHandler(Handler handler);

    HandlerId registerHandler(Handler handler);
    bool removeHandler(HandlerId id);

    void dispatch(const Envelope& envelope);

    int handlerCount() const { return static_cast<int>(m_handlers.size()); }

private:
    std::map<HandlerId, Handler> m_handlers;
    HandlerId m_nextId = 1;
};

#endif // EVENTROUTER_H
