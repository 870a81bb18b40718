/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookEvent.h"

#include <QMetaEnum>

namespace Conductor
{

HookEvent::Kind HookEvent::kindFromName(const QString &name)
{
    if (name.isEmpty()) {
        return Kind::Unknown;
    }
    const QMetaEnum meta = QMetaEnum::fromType<Kind>();
    bool ok = false;
    const int value = meta.keyToValue(name.toLatin1().constData(), &ok);
    if (!ok || value == static_cast<int>(Kind::Unknown)) {
        return Kind::Unknown;
    }
    return static_cast<Kind>(value);
}

QString HookEvent::nameOf(Kind kind)
{
    return QString::fromLatin1(QMetaEnum::fromType<Kind>().valueToKey(static_cast<int>(kind)));
}

QList<HookEvent::Kind> HookEvent::knownKinds()
{
    QList<Kind> kinds;
    const QMetaEnum meta = QMetaEnum::fromType<Kind>();
    for (int i = 0; i < meta.keyCount(); ++i) {
        const auto kind = static_cast<Kind>(meta.value(i));
        if (kind != Kind::Unknown) {
            kinds.append(kind);
        }
    }
    return kinds;
}

HookEvent HookEvent::fromJson(const QJsonObject &obj)
{
    HookEvent event;
    event.eventName = obj.value(QStringLiteral("hook_event_name")).toString();
    event.kind = kindFromName(event.eventName);
    event.externalSessionId = obj.value(QStringLiteral("session_id")).toString();
    event.workingDirectory = obj.value(QStringLiteral("cwd")).toString();
    event.transcriptPath = obj.value(QStringLiteral("transcript_path")).toString();
    event.notificationType = obj.value(QStringLiteral("notification_type")).toString();
    if (event.notificationType.isEmpty()) {
        event.notificationType = obj.value(QStringLiteral("type")).toString();
    }
    event.toolName = obj.value(QStringLiteral("tool_name")).toString();
    event.message = obj.value(QStringLiteral("message")).toString();
    event.receivedAt = QDateTime::currentDateTimeUtc();
    return event;
}

QJsonObject HookEvent::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("hook_event_name")] = kind == Kind::Unknown ? eventName : nameOf(kind);
    obj[QStringLiteral("session_id")] = externalSessionId;
    if (!workingDirectory.isEmpty()) {
        obj[QStringLiteral("cwd")] = workingDirectory;
    }
    if (!transcriptPath.isEmpty()) {
        obj[QStringLiteral("transcript_path")] = transcriptPath;
    }
    if (!notificationType.isEmpty()) {
        obj[QStringLiteral("notification_type")] = notificationType;
    }
    if (!toolName.isEmpty()) {
        obj[QStringLiteral("tool_name")] = toolName;
    }
    if (!message.isEmpty()) {
        obj[QStringLiteral("message")] = message;
    }
    return obj;
}

bool HookEvent::isPermissionNotification() const
{
    if (kind != Kind::Notification) {
        return false;
    }
    return notificationType == QLatin1String("permission_prompt")
        || notificationType == QLatin1String("permission_request")
        || notificationType == QLatin1String("permission")
        || notificationType == QLatin1String("permission_required");
}

bool HookEvent::requestsPermission() const
{
    return kind == Kind::PermissionRequest || isPermissionNotification();
}

} // namespace Conductor

#include "moc_HookEvent.cpp"
