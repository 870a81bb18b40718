/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONTYPES_H
#define SESSIONTYPES_H

#include "conductor_export.h"

#include <QMetaType>
#include <QObject>
#include <QString>

namespace Conductor
{
Q_NAMESPACE_EXPORT(CONDUCTOR_EXPORT)

/**
 * What the agent inside a session is believed to be doing.
 * Driven only by hook events and process exit.
 */
enum class ActivityState {
    Starting,
    Idle,
    Working,
    WaitingForInput,
    WaitingForPermission,
    Exited
};
Q_ENUM_NS(ActivityState)

/**
 * OS-level state of the process behind a session
 */
enum class ProcessStatus {
    Starting,
    Running,
    Exiting,
    Exited,
    Failed
};
Q_ENUM_NS(ProcessStatus)

enum class BackendKind {
    Pty,
    Stateless,
    ExternallyOwned
};
Q_ENUM_NS(BackendKind)

/**
 * Outcome of matching terminal content against transcripts
 */
enum class VerificationStatus {
    Waiting,
    Potential,
    Matched,
    Failed
};
Q_ENUM_NS(VerificationStatus)

CONDUCTOR_EXPORT QString toString(ActivityState state);
CONDUCTOR_EXPORT QString toString(ProcessStatus status);
CONDUCTOR_EXPORT QString toString(BackendKind kind);
CONDUCTOR_EXPORT QString toString(VerificationStatus status);

/**
 * Parse the names produced by toString(). Unknown names yield
 * @p ok == false and the first enumerator.
 */
CONDUCTOR_EXPORT ActivityState activityStateFromString(const QString &name, bool *ok = nullptr);
CONDUCTOR_EXPORT BackendKind backendKindFromString(const QString &name, bool *ok = nullptr);
CONDUCTOR_EXPORT VerificationStatus verificationStatusFromString(const QString &name, bool *ok = nullptr);

} // namespace Conductor

#endif // SESSIONTYPES_H
