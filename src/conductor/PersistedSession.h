/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PERSISTEDSESSION_H
#define PERSISTEDSESSION_H

#include "conductor_export.h"

#include "PromptQueue.h"
#include "SessionTypes.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUuid>

namespace Conductor
{

/**
 * PersistedSession is the on-disk snapshot of one session.
 *
 * It is written as part of the whole state file on every save and never
 * updated in place.
 */
class CONDUCTOR_EXPORT PersistedSession
{
public:
    PersistedSession() = default;
    ~PersistedSession() = default;

    // Identity
    QUuid id;
    QString workingDirectory;
    BackendKind backendKind = BackendKind::Pty;
    QString externalSessionId;  // empty when unknown or cleared for re-verification
    QDateTime createdAt;

    // Last known state
    ActivityState activityState = ActivityState::Starting;
    VerificationStatus verificationStatus = VerificationStatus::Waiting;
    QString expectedFirstPrompt;
    QString verifiedFirstPrompt;
    QString potentialExternalId;

    // User metadata
    QString customName;
    QString customColor;        // "#rrggbb" or empty
    QString pendingPromptText;
    int sortOrder = 0;
    QList<PromptQueueItem> queuedPrompts;

    // Backend extras
    QStringList claudeArgs;
    qint64 processId = 0;
    qint64 windowHandle = 0;    // ExternallyOwned only

    bool isValid() const
    {
        return !id.isNull() && !workingDirectory.isEmpty();
    }

    QJsonObject toJson() const;
    /**
     * A record naming a backend kind this build does not know comes back
     * invalid, with @p errorMessage set. A record without one is a pty session.
     */
    static PersistedSession fromJson(const QJsonObject &obj, QString *errorMessage = nullptr);

    bool operator==(const PersistedSession &other) const
    {
        return id == other.id;
    }
};

} // namespace Conductor

#endif // PERSISTEDSESSION_H
