/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include "conductor_export.h"

#include "AgentOptions.h"
#include "PersistedSession.h"
#include "Session.h"
#include "SessionStore.h"
#include "SessionTypes.h"

#include <QHash>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QUuid>

#include <functional>

namespace Conductor
{


/**
 * Parameters for a new session
 */
struct CONDUCTOR_EXPORT SessionOptions {
    QString workingDirectory;
    BackendKind kind = BackendKind::Pty;

    /// Program to run; empty means the agent from AgentOptions
    QString executable;
    /// Used as-is when set; otherwise the agent's default arguments
    QStringList arguments;
    bool useDefaultArguments = true;

    /// Agent session to resume; pre-binds the external id
    QString resumeExternalId;
    QString expectedFirstPrompt;

    /// ExternallyOwned only
    qint64 externalProcessId = 0;
    qint64 windowHandle = 0;
};

/**
 * SessionManager owns every Session and the index from the agent's own
 * session id to our session.
 *
 * Features:
 * - Creates sessions through a backend factory per BackendKind
 * - Binds external ids, first writer wins
 * - Saves and restores sessions through a SessionStore
 * - Marks sessions whose process disappeared as failed (orphan scan)
 *
 * The registry and the index are guarded by one mutex. Signals are always
 * emitted after the mutex is released.
 */
class CONDUCTOR_EXPORT SessionManager : public QObject
{
    Q_OBJECT

public:
    using BackendFactory = std::function<SessionBackend *(const SessionOptions &options, const AgentOptions &agent)>;

    explicit SessionManager(const AgentOptions &options = AgentOptions(), QObject *parent = nullptr);
    ~SessionManager() override;

    const AgentOptions &options() const { return m_options; }

    /**
     * Replace the backend factory for @p kind
     */
    void setBackendFactory(BackendKind kind, BackendFactory factory);

    /**
     * Create and start a session.
     *
     * @return the new session, or nullptr if the working directory is
     *         invalid, no factory handles the kind, or the backend did not
     *         start. A session that fails to start is never registered.
     */
    Session *createSession(const SessionOptions &options, QString *errorMessage = nullptr);

    /**
     * All sessions ordered by sort order, then creation time
     */
    QList<Session *> sessions() const;
    int count() const;

    Session *session(const QUuid &id) const;
    Session *sessionByExternalId(const QString &externalSessionId) const;

    /**
     * Bind @p externalSessionId to a session.
     *
     * Re-registering the same pair succeeds without change. A claim on an id
     * that another session already holds is refused, as is replacing a
     * verified id.
     */
    bool registerExternalId(const QUuid &id, const QString &externalSessionId);

    /**
     * Replace a session's external id on the operator's request.
     * Refused if another session holds @p externalSessionId.
     * Verification starts over for the new id.
     */
    bool relinkExternalId(const QUuid &id, const QString &externalSessionId);

    /**
     * Drop a session's external id, e.g. to force re-verification
     */
    bool clearExternalId(const QUuid &id);

    /**
     * Bind an id confirmed by transcript verification and mark the session
     * Matched in one step. A session holding the id without confirmation
     * loses it; one with a confirmed claim keeps it and this call fails.
     */
    bool applyVerifiedLink(const QUuid &id, const QString &externalSessionId, const QString &firstPrompt = QString());

    /**
     * Remove a session, tearing down its backend. Unknown ids are ignored.
     */
    void removeSession(const QUuid &id);

    void killSession(const QUuid &id);
    void killAllSessions();

    /**
     * Rewrite sort orders to follow @p orderedIds; sessions not listed
     * keep their relative order after them.
     */
    void reorderSessions(const QList<QUuid> &orderedIds);

    /**
     * Rebuild the external id index from the sessions' own fields
     */
    void rebuildExternalIndex();

    // Persistence
    bool saveState(const SessionStore &store) const;

    /**
     * Read persisted sessions, ordered by sort order. When several records
     * claim the same external id only the first keeps it; the others are
     * cleared and need verification again.
     *
     * @param loadResult receives the store's status, without its sessions
     */
    QList<PersistedSession> loadState(const SessionStore &store, SessionStore::LoadResult *loadResult = nullptr) const;

    /**
     * Rebuild one session from its record and start it
     */
    Session *restoreSession(const PersistedSession &state, QString *errorMessage = nullptr);

    struct RestoreResult {
        int restoredCount = 0;
        int failedCount = 0;
        /// False when an existing state file could not be read
        bool success = true;
        bool fileExistedButFailed = false;
        QString errorMessage;
        /// Copy of the unreadable file, empty when none was made
        QString backupPath;
    };

    /**
     * loadState() followed by restoreSession() for each record, an orphan
     * scan and an index rebuild. An existing file that cannot be read is
     * copied aside before the manager starts with no sessions.
     */
    RestoreResult restoreState(const SessionStore &store);

    /**
     * Mark sessions whose recorded process no longer exists as failed
     *
     * @return number of sessions marked
     */
    int scanForOrphans();

    /**
     * Static helper shared by loadState(): clears duplicate external ids
     */
    static QList<PersistedSession> deduplicateExternalIds(QList<PersistedSession> sessions);

Q_SIGNALS:
    void sessionCreated(Conductor::Session *session);
    void sessionRemoved(const QUuid &id);
    void externalIdRegistered(Conductor::Session *session, const QString &externalSessionId);

private:
    Session *launch(const QUuid &id, const QDateTime &createdAt, const SessionOptions &requested, const PersistedSession *snapshot, QString *errorMessage);
    LaunchSpec launchSpecFor(const SessionOptions &options) const;
    void installDefaultFactories();

    AgentOptions m_options;
    QMap<BackendKind, BackendFactory> m_factories;

    mutable QMutex m_mutex;
    QHash<QUuid, Session *> m_sessions;
    QHash<QString, QUuid> m_externalIndex;
};

} // namespace Conductor

#endif // SESSIONMANAGER_H
