/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSION_H
#define SESSION_H

#include "conductor_export.h"

#include "ActivityStateMachine.h"
#include "HookEvent.h"
#include "PersistedSession.h"
#include "PromptQueue.h"
#include "SessionBackend.h"
#include "SessionTypes.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QUuid>

#include <functional>

namespace Conductor
{

class SessionManager;
class SessionVerifier;

/**
 * Session is one supervised agent bound to a working directory.
 *
 * It owns its backend (and through it the terminal buffer), its activity
 * state machine and its prompt queue. Sessions are created and destroyed
 * only by SessionManager.
 *
 * The external session id and the verification fields can only be changed
 * by SessionManager and SessionVerifier, so the manager's external id
 * index always agrees with the sessions.
 */
class CONDUCTOR_EXPORT Session : public QObject
{
    Q_OBJECT

public:
    /**
     * Takes ownership of @p backend. The backend is not started here.
     */
    Session(const QUuid &id, const QString &workingDirectory, SessionBackend *backend, const QDateTime &createdAt = QDateTime(), QObject *parent = nullptr);
    ~Session() override;

    // Identity
    QUuid id() const { return m_id; }
    QString workingDirectory() const { return m_workingDirectory; }
    BackendKind backendKind() const { return m_backend->kind(); }
    QDateTime createdAt() const { return m_createdAt; }
    QString externalSessionId() const;

    // Parts
    SessionBackend *backend() const { return m_backend; }
    TerminalBuffer *buffer() const { return m_backend->buffer(); }
    PromptQueue *promptQueue() const { return m_promptQueue; }

    // Process
    ActivityState activityState() const { return m_activity->state(); }
    ProcessStatus processStatus() const { return m_backend->status(); }
    qint64 processId() const { return m_backend->processId(); }
    int exitCode() const { return m_backend->exitCode(); }

    // Verification
    VerificationStatus verificationStatus() const;
    QString potentialExternalId() const;
    QString expectedFirstPrompt() const;
    void setExpectedFirstPrompt(const QString &prompt);
    QString verifiedFirstPrompt() const;

    // User metadata
    QString customName() const;
    void setCustomName(const QString &name);
    QString customColor() const;
    void setCustomColor(const QString &color);
    QString pendingPromptText() const;
    void setPendingPromptText(const QString &text);
    int sortOrder() const;
    void setSortOrder(int order);

    /**
     * Arguments the agent was launched with, without resume flags
     */
    QStringList launchArguments() const { return m_launchArguments; }
    void setLaunchArguments(const QStringList &args) { m_launchArguments = args; }

    // Input
    void sendInput(const QByteArray &data);
    void sendText(const QString &text, std::function<void(bool)> done = {});

    /**
     * Take a queued prompt out of the queue and send it
     *
     * @return false if @p itemId is not queued, or the session is not running
     *         or busy. A send that fails afterwards requeues the prompt.
     */
    bool sendQueuedPrompt(const QUuid &itemId);

    void interrupt();
    void resize(int columns, int rows);

    /**
     * Shut the process down, escalating to a forced kill after @p timeoutMs.
     * Completion is signalled by processExited(). Idempotent.
     */
    void kill(int timeoutMs);

    /**
     * Apply a routed hook event to the activity state machine
     */
    void handleHookEvent(const HookEvent &event);

    /**
     * Snapshot for the state file
     */
    PersistedSession snapshot() const;

    /**
     * Restore user metadata and verification fields from a snapshot.
     * Identity and the external id are not touched.
     */
    void applySnapshot(const PersistedSession &state);

Q_SIGNALS:
    void activityStateChanged(Conductor::ActivityState oldState, Conductor::ActivityState newState);
    void processStatusChanged(Conductor::ProcessStatus status);
    void processExited(int exitCode);
    void externalSessionIdChanged(const QString &externalSessionId);
    void verificationStatusChanged(Conductor::VerificationStatus status);
    void metadataChanged();

private:
    friend class SessionManager;
    friend class SessionVerifier;

    void setExternalSessionId(const QString &externalSessionId);

    /**
     * Set the id without notifying; the caller emits
     * externalSessionIdChanged() once its own locks are released.
     */
    bool assignExternalSessionId(const QString &externalSessionId);
    void setVerificationStatus(VerificationStatus status);
    bool assignVerificationStatus(VerificationStatus status);
    void setVerifiedFirstPrompt(const QString &prompt);
    void setPotentialExternalId(const QString &id);

    bool tryBeginVerification();
    void endVerification();
    bool isVerificationSettled() const;
    void setVerificationSettled(bool settled);

    const QUuid m_id;
    const QString m_workingDirectory;
    const QDateTime m_createdAt;
    SessionBackend *m_backend;
    ActivityStateMachine *m_activity;
    PromptQueue *m_promptQueue;
    QStringList m_launchArguments;

    mutable QMutex m_mutex;
    QString m_externalSessionId;
    VerificationStatus m_verificationStatus = VerificationStatus::Waiting;
    QString m_potentialExternalId;
    QString m_expectedFirstPrompt;
    QString m_verifiedFirstPrompt;
    QString m_customName;
    QString m_customColor;
    QString m_pendingPromptText;
    int m_sortOrder = 0;
    bool m_verificationSettled = false;
    QAtomicInt m_verificationRunning = 0;
};

} // namespace Conductor

#endif // SESSION_H
