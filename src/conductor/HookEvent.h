/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKEVENT_H
#define HOOKEVENT_H

#include "conductor_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

namespace Conductor
{

/**
 * HookEvent is one lifecycle notification delivered by the agent's hook
 * mechanism. It is never persisted.
 *
 * The wire form is the JSON object the agent hands to its hook command
 * on stdin, e.g.
 *
 *   {"hook_event_name":"Stop","session_id":"...","cwd":"/src/app"}
 */
class CONDUCTOR_EXPORT HookEvent
{
    Q_GADGET

public:
    enum class Kind {
        Unknown,
        SessionStart,
        UserPromptSubmit,
        PreToolUse,
        PostToolUse,
        PostToolUseFailure,
        PermissionRequest,
        Notification,
        Stop,
        SubagentStart,
        SubagentStop,
        TaskCompleted,
        TeammateIdle,
        PreCompact,
        SessionEnd
    };
    Q_ENUM(Kind)

    Kind kind = Kind::Unknown;
    QString eventName; ///< raw tag as received, kept for logging unknown kinds
    QString externalSessionId;
    QString workingDirectory;
    QString transcriptPath;
    QString notificationType;
    QString toolName;
    QString message;
    QDateTime receivedAt;

    static Kind kindFromName(const QString &name);
    static QString nameOf(Kind kind);

    /**
     * All kinds except Unknown, in declaration order
     */
    static QList<Kind> knownKinds();

    /**
     * Build an event from a decoded hook payload. Missing fields stay empty;
     * an unrecognised tag yields Kind::Unknown with eventName preserved.
     */
    static HookEvent fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    /**
     * True for a Notification whose type asks the operator for permission
     */
    bool isPermissionNotification() const;

    /**
     * True for PermissionRequest and permission-class notifications
     */
    bool requestsPermission() const;
};

} // namespace Conductor

Q_DECLARE_METATYPE(Conductor::HookEvent)

#endif // HOOKEVENT_H
