/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ActivityStateMachine.h"

#include <QDebug>
#include <QMutexLocker>

namespace Conductor
{

ActivityStateMachine::ActivityStateMachine(QObject *parent)
    : QObject(parent)
{
}

ActivityStateMachine::~ActivityStateMachine() = default;

ActivityState ActivityStateMachine::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

ActivityState ActivityStateMachine::transition(ActivityState current, const HookEvent &event)
{
    if (current == ActivityState::Exited) {
        return current;
    }

    using Kind = HookEvent::Kind;

    if (event.kind == Kind::SessionEnd) {
        return ActivityState::Exited;
    }
    if (event.requestsPermission()) {
        return ActivityState::WaitingForPermission;
    }
    if (event.kind == Kind::UserPromptSubmit) {
        return ActivityState::Working;
    }

    // Everything below is a lower-priority signal that must not
    // pull the agent out of waiting on the operator
    if (current == ActivityState::WaitingForInput) {
        return current;
    }

    switch (event.kind) {
    case Kind::SessionStart:
        return ActivityState::Idle;
    case Kind::PreToolUse:
    case Kind::PostToolUse:
    case Kind::PostToolUseFailure:
    case Kind::SubagentStart:
    case Kind::SubagentStop:
    case Kind::TaskCompleted:
        return ActivityState::Working;
    case Kind::Stop:
    case Kind::Notification:
        return ActivityState::WaitingForInput;
    case Kind::TeammateIdle:
    case Kind::PreCompact:
    case Kind::Unknown:
    default:
        return current;
    }
}

bool ActivityStateMachine::apply(const HookEvent &event)
{
    if (event.kind == HookEvent::Kind::Unknown) {
        qDebug() << "ActivityStateMachine: Ignoring unknown hook event" << event.eventName;
        return false;
    }

    ActivityState oldState;
    ActivityState newState;
    {
        QMutexLocker locker(&m_mutex);
        oldState = m_state;
        newState = transition(m_state, event);
        if (newState == oldState) {
            return false;
        }
        m_state = newState;
    }

    qDebug() << "ActivityStateMachine:" << event.eventName << "moved" << toString(oldState) << "->" << toString(newState);
    Q_EMIT stateChanged(oldState, newState);
    return true;
}

bool ActivityStateMachine::applyProcessExit()
{
    return moveTo(ActivityState::Exited);
}

bool ActivityStateMachine::moveTo(ActivityState newState)
{
    ActivityState oldState;
    {
        QMutexLocker locker(&m_mutex);
        oldState = m_state;
        if (oldState == newState || oldState == ActivityState::Exited) {
            return false;
        }
        m_state = newState;
    }

    Q_EMIT stateChanged(oldState, newState);
    return true;
}

} // namespace Conductor

#include "moc_ActivityStateMachine.cpp"
