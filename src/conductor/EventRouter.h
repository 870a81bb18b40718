/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTROUTER_H
#define EVENTROUTER_H

#include "conductor_export.h"

#include "HookEvent.h"

#include <QObject>
#include <QPointer>

namespace Conductor
{

class HookServer;
class Session;
class SessionManager;

/**
 * EventRouter delivers hook events to the session that owns the agent
 * session id named in the event.
 *
 * Events for an id no session has claimed are logged and reported through
 * unroutedEvent(); the router never creates or binds a session itself.
 */
class CONDUCTOR_EXPORT EventRouter : public QObject
{
    Q_OBJECT

public:
    explicit EventRouter(SessionManager *manager, QObject *parent = nullptr);
    ~EventRouter() override;

    /**
     * Receive events from @p server. Delivery is queued so routing never
     * holds up the server's accept loop, and events keep arrival order.
     */
    void attach(HookServer *server);

public Q_SLOTS:
    /**
     * @return true if a session received the event
     */
    bool route(const Conductor::HookEvent &event);

Q_SIGNALS:
    void eventRouted(Conductor::Session *session, const Conductor::HookEvent &event);
    void unroutedEvent(const Conductor::HookEvent &event);

private:
    QPointer<SessionManager> m_manager;
};

} // namespace Conductor

#endif // EVENTROUTER_H
