/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYSTATEMACHINE_H
#define ACTIVITYSTATEMACHINE_H

#include "conductor_export.h"

#include "HookEvent.h"
#include "SessionTypes.h"

#include <QMutex>
#include <QObject>

namespace Conductor
{

/**
 * ActivityStateMachine derives what the agent is doing from its hook events.
 *
 * Edges:
 * - SessionStart                                  -> Idle
 * - UserPromptSubmit                              -> Working
 * - PreToolUse, PostToolUse(Failure), SubagentStart,
 *   SubagentStop, TaskCompleted                   -> Working
 * - Stop, other Notification                      -> WaitingForInput
 * - PermissionRequest, permission Notification    -> WaitingForPermission
 * - SessionEnd, process exit                      -> Exited
 *
 * WaitingForInput is only left through UserPromptSubmit, a permission
 * request or SessionEnd, so late events from a staged completion cannot
 * pull the agent back to Working. Exited is absorbing.
 *
 * stateChanged() is emitted only for a real change, outside the lock.
 */
class CONDUCTOR_EXPORT ActivityStateMachine : public QObject
{
    Q_OBJECT

public:
    explicit ActivityStateMachine(QObject *parent = nullptr);
    ~ActivityStateMachine() override;

    ActivityState state() const;

    /**
     * Apply a hook event
     *
     * @return true if the state changed
     */
    bool apply(const HookEvent &event);

    /**
     * The backing process is gone
     */
    bool applyProcessExit();

    /**
     * Target state for @p event from @p current, or @p current if the
     * event does not move the machine. Pure; exposed for tests.
     */
    static ActivityState transition(ActivityState current, const HookEvent &event);

Q_SIGNALS:
    void stateChanged(Conductor::ActivityState oldState, Conductor::ActivityState newState);

private:
    bool moveTo(ActivityState newState);

    mutable QMutex m_mutex;
    ActivityState m_state = ActivityState::Starting;
};

} // namespace Conductor

#endif // ACTIVITYSTATEMACHINE_H
