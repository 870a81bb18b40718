/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PersistedSession.h"

#include <QJsonArray>

namespace Conductor
{

QJsonObject PersistedSession::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id.toString(QUuid::WithoutBraces);
    obj[QStringLiteral("workingDirectory")] = workingDirectory;
    obj[QStringLiteral("backendKind")] = toString(backendKind);
    if (!externalSessionId.isEmpty()) {
        obj[QStringLiteral("externalSessionId")] = externalSessionId;
    }
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    obj[QStringLiteral("activityState")] = toString(activityState);
    obj[QStringLiteral("terminalVerificationStatus")] = toString(verificationStatus);
    if (!expectedFirstPrompt.isEmpty()) {
        obj[QStringLiteral("expectedFirstPrompt")] = expectedFirstPrompt;
    }
    if (!verifiedFirstPrompt.isEmpty()) {
        obj[QStringLiteral("verifiedFirstPrompt")] = verifiedFirstPrompt;
    }
    if (!potentialExternalId.isEmpty()) {
        obj[QStringLiteral("potentialExternalId")] = potentialExternalId;
    }
    if (!customName.isEmpty()) {
        obj[QStringLiteral("customName")] = customName;
    }
    if (!customColor.isEmpty()) {
        obj[QStringLiteral("customColor")] = customColor;
    }
    if (!pendingPromptText.isEmpty()) {
        obj[QStringLiteral("pendingPromptText")] = pendingPromptText;
    }
    obj[QStringLiteral("sortOrder")] = sortOrder;

    QJsonArray queue;
    for (const PromptQueueItem &item : queuedPrompts) {
        queue.append(item.toJson());
    }
    obj[QStringLiteral("queuedPrompts")] = queue;

    if (!claudeArgs.isEmpty()) {
        obj[QStringLiteral("claudeArgs")] = QJsonArray::fromStringList(claudeArgs);
    }
    // JSON numbers are doubles; pids and window handles fit in 53 bits
    obj[QStringLiteral("processId")] = static_cast<double>(processId);
    if (windowHandle != 0) {
        obj[QStringLiteral("windowHandle")] = static_cast<double>(windowHandle);
    }
    return obj;
}

PersistedSession PersistedSession::fromJson(const QJsonObject &obj, QString *errorMessage)
{
    PersistedSession state;

    const QJsonValue kind = obj.value(QStringLiteral("backendKind"));
    if (!kind.isUndefined()) {
        bool ok = false;
        state.backendKind = backendKindFromString(kind.toString(), &ok);
        if (!ok) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Unknown backend kind \"%1\"").arg(kind.toString());
            }
            return PersistedSession();
        }
    }

    state.id = QUuid::fromString(obj.value(QStringLiteral("id")).toString());
    state.workingDirectory = obj.value(QStringLiteral("workingDirectory")).toString();
    state.externalSessionId = obj.value(QStringLiteral("externalSessionId")).toString();
    state.createdAt = QDateTime::fromString(obj.value(QStringLiteral("createdAt")).toString(), Qt::ISODate);
    state.activityState = activityStateFromString(obj.value(QStringLiteral("activityState")).toString());
    state.verificationStatus = verificationStatusFromString(obj.value(QStringLiteral("terminalVerificationStatus")).toString());
    state.expectedFirstPrompt = obj.value(QStringLiteral("expectedFirstPrompt")).toString();
    state.verifiedFirstPrompt = obj.value(QStringLiteral("verifiedFirstPrompt")).toString();
    state.potentialExternalId = obj.value(QStringLiteral("potentialExternalId")).toString();
    state.customName = obj.value(QStringLiteral("customName")).toString();
    state.customColor = obj.value(QStringLiteral("customColor")).toString();
    state.pendingPromptText = obj.value(QStringLiteral("pendingPromptText")).toString();
    state.sortOrder = obj.value(QStringLiteral("sortOrder")).toInt();

    const QJsonArray queue = obj.value(QStringLiteral("queuedPrompts")).toArray();
    for (const QJsonValue &value : queue) {
        const PromptQueueItem item = PromptQueueItem::fromJson(value.toObject());
        if (item.isValid()) {
            state.queuedPrompts.append(item);
        }
    }

    const QJsonArray args = obj.value(QStringLiteral("claudeArgs")).toArray();
    for (const QJsonValue &value : args) {
        state.claudeArgs.append(value.toString());
    }
    state.processId = static_cast<qint64>(obj.value(QStringLiteral("processId")).toDouble());
    state.windowHandle = static_cast<qint64>(obj.value(QStringLiteral("windowHandle")).toDouble());
    return state;
}

} // namespace Conductor
