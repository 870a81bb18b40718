/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EventRouter.h"

#include "HookServer.h"
#include "Session.h"
#include "SessionManager.h"

#include <QDebug>

namespace Conductor
{

EventRouter::EventRouter(SessionManager *manager, QObject *parent)
    : QObject(parent)
    , m_manager(manager)
{
}

EventRouter::~EventRouter() = default;

void EventRouter::attach(HookServer *server)
{
    connect(server, &HookServer::eventReceived, this, &EventRouter::route, Qt::QueuedConnection);
}

bool EventRouter::route(const HookEvent &event)
{
    if (!m_manager) {
        return false;
    }

    if (event.externalSessionId.isEmpty()) {
        qDebug() << "EventRouter: Dropping" << event.eventName << "without session id";
        Q_EMIT unroutedEvent(event);
        return false;
    }

    Session *session = m_manager->sessionByExternalId(event.externalSessionId);
    if (!session) {
        qDebug() << "EventRouter: No session for" << event.externalSessionId << "- dropping" << event.eventName;
        Q_EMIT unroutedEvent(event);
        return false;
    }

    session->handleHookEvent(event);
    Q_EMIT eventRouted(session, event);
    return true;
}

} // namespace Conductor

#include "moc_EventRouter.cpp"
