/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionManager.h"

#include "ExternalBackend.h"
#include "PtyBackend.h"
#include "SessionStore.h"
#include "StatelessBackend.h"

#include <QDebug>
#include <QMutexLocker>
#include <QSet>

#include <algorithm>

namespace Conductor
{

SessionManager::SessionManager(const AgentOptions &options, QObject *parent)
    : QObject(parent)
    , m_options(options)
{
    installDefaultFactories();
}

SessionManager::~SessionManager()
{
    QList<Session *> owned;
    {
        QMutexLocker locker(&m_mutex);
        owned = m_sessions.values();
        m_sessions.clear();
        m_externalIndex.clear();
    }
    qDeleteAll(owned);
}

void SessionManager::installDefaultFactories()
{
    m_factories.insert(BackendKind::Pty, [](const SessionOptions &, const AgentOptions &agent) -> SessionBackend * {
        return new PtyBackend(agent.bufferSizeBytes);
    });
    m_factories.insert(BackendKind::Stateless, [](const SessionOptions &, const AgentOptions &agent) -> SessionBackend * {
        return new StatelessBackend(agent.bufferSizeBytes);
    });
    m_factories.insert(BackendKind::ExternallyOwned, [](const SessionOptions &options, const AgentOptions &) -> SessionBackend * {
        return new ExternalBackend(options.externalProcessId, options.windowHandle);
    });
}

void SessionManager::setBackendFactory(BackendKind kind, BackendFactory factory)
{
    if (factory) {
        m_factories.insert(kind, std::move(factory));
    } else {
        m_factories.remove(kind);
    }
}

LaunchSpec SessionManager::launchSpecFor(const SessionOptions &options) const
{
    LaunchSpec spec;
    spec.workingDirectory = options.workingDirectory;
    spec.columns = m_options.terminalColumns;
    spec.rows = m_options.terminalRows;

    QStringList args = options.arguments;
    if (args.isEmpty() && options.useDefaultArguments) {
        args = m_options.defaultClaudeArgs;
    }

    if (!options.executable.isEmpty()) {
        spec.executable = options.executable;
        spec.arguments = args;
        return spec;
    }

    spec.executable = m_options.claudePath;
    if (options.kind == BackendKind::Stateless) {
        // --resume is appended per exchange by the backend
        args.prepend(QStringLiteral("-p"));
    } else if (!options.resumeExternalId.isEmpty()) {
        args << QStringLiteral("--resume") << options.resumeExternalId;
    }
    spec.arguments = args;
    return spec;
}

Session *SessionManager::createSession(const SessionOptions &options, QString *errorMessage)
{
    return launch(QUuid::createUuid(), QDateTime::currentDateTimeUtc(), options, nullptr, errorMessage);
}

Session *SessionManager::launch(const QUuid &id, const QDateTime &createdAt, const SessionOptions &requested, const PersistedSession *snapshot, QString *errorMessage)
{
    if (!SessionBackend::validateWorkingDirectory(requested.workingDirectory, errorMessage)) {
        qWarning() << "SessionManager: Rejected session for" << requested.workingDirectory;
        return nullptr;
    }

    // Never resume a conversation another session is attached to
    SessionOptions options = requested;
    bool resumeDropped = false;
    if (!options.resumeExternalId.isEmpty() && sessionByExternalId(options.resumeExternalId)) {
        qWarning() << "SessionManager: External id" << options.resumeExternalId << "already belongs to another session, starting without it";
        options.resumeExternalId.clear();
        resumeDropped = true;
    }

    const BackendFactory factory = m_factories.value(options.kind);
    if (!factory) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No backend available for kind %1").arg(toString(options.kind));
        }
        return nullptr;
    }

    SessionBackend *backend = factory(options, m_options);
    if (!backend) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Backend factory for %1 returned nothing").arg(toString(options.kind));
        }
        return nullptr;
    }

    auto *session = new Session(id, options.workingDirectory, backend, createdAt);
    const LaunchSpec spec = launchSpecFor(options);
    session->setLaunchArguments(options.arguments.isEmpty() && options.useDefaultArguments ? m_options.defaultClaudeArgs : options.arguments);
    if (snapshot) {
        session->applySnapshot(*snapshot);
    }
    if (resumeDropped) {
        session->assignVerificationStatus(VerificationStatus::Waiting);
        session->setVerificationSettled(false);
    }
    if (!options.expectedFirstPrompt.isEmpty()) {
        session->setExpectedFirstPrompt(options.expectedFirstPrompt);
    }
    // Stateless backends read the resume id from the session before the first exchange
    if (!options.resumeExternalId.isEmpty()) {
        session->assignExternalSessionId(options.resumeExternalId);
    }

    if (!backend->start(spec, errorMessage)) {
        qWarning() << "SessionManager: Failed to start session in" << options.workingDirectory;
        delete session;
        return nullptr;
    }

    bool bound = false;
    int sortOrder = 0;
    {
        QMutexLocker locker(&m_mutex);

        const QString externalId = session->externalSessionId();
        if (!externalId.isEmpty()) {
            if (m_externalIndex.contains(externalId)) {
                qWarning() << "SessionManager: External id" << externalId << "already belongs to another session, not binding";
                session->assignExternalSessionId(QString());
                session->assignVerificationStatus(VerificationStatus::Waiting);
                session->setVerificationSettled(false);
            } else {
                m_externalIndex.insert(externalId, id);
                bound = true;
            }
        }

        if (!snapshot) {
            for (Session *other : std::as_const(m_sessions)) {
                sortOrder = std::max(sortOrder, other->sortOrder() + 1);
            }
        }
        m_sessions.insert(id, session);
    }

    session->setParent(this);
    if (!snapshot) {
        session->setSortOrder(sortOrder);
    }

    qDebug() << "SessionManager: Created session" << id.toString(QUuid::WithoutBraces) << toString(options.kind) << "in" << options.workingDirectory;
    Q_EMIT sessionCreated(session);
    if (bound) {
        Q_EMIT externalIdRegistered(session, session->externalSessionId());
    }
    return session;
}

QList<Session *> SessionManager::sessions() const
{
    QList<Session *> list;
    {
        QMutexLocker locker(&m_mutex);
        list = m_sessions.values();
    }
    std::stable_sort(list.begin(), list.end(), [](Session *a, Session *b) {
        if (a->sortOrder() != b->sortOrder()) {
            return a->sortOrder() < b->sortOrder();
        }
        return a->createdAt() < b->createdAt();
    });
    return list;
}

int SessionManager::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_sessions.size();
}

Session *SessionManager::session(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    return m_sessions.value(id, nullptr);
}

Session *SessionManager::sessionByExternalId(const QString &externalSessionId) const
{
    if (externalSessionId.isEmpty()) {
        return nullptr;
    }
    QMutexLocker locker(&m_mutex);
    const auto it = m_externalIndex.constFind(externalSessionId);
    if (it == m_externalIndex.constEnd()) {
        return nullptr;
    }
    return m_sessions.value(it.value(), nullptr);
}

bool SessionManager::registerExternalId(const QUuid &id, const QString &externalSessionId)
{
    if (externalSessionId.isEmpty()) {
        return false;
    }

    Session *session = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        session = m_sessions.value(id, nullptr);
        if (!session) {
            qWarning() << "SessionManager: Cannot register external id for unknown session" << id;
            return false;
        }

        const auto holder = m_externalIndex.constFind(externalSessionId);
        if (holder != m_externalIndex.constEnd()) {
            if (holder.value() == id) {
                return true;
            }
            qWarning() << "SessionManager: External id" << externalSessionId << "already registered to" << holder.value() << "- keeping first claim";
            return false;
        }

        const QString current = session->externalSessionId();
        if (!current.isEmpty()) {
            if (session->verificationStatus() == VerificationStatus::Matched) {
                qWarning() << "SessionManager: Session" << id << "is verified as" << current << "- ignoring claim for" << externalSessionId;
                return false;
            }
            m_externalIndex.remove(current);
        }

        m_externalIndex.insert(externalSessionId, id);
        session->assignExternalSessionId(externalSessionId);
    }

    qDebug() << "SessionManager: Registered external id" << externalSessionId << "for" << id;
    Q_EMIT session->externalSessionIdChanged(externalSessionId);
    Q_EMIT externalIdRegistered(session, externalSessionId);
    return true;
}

bool SessionManager::relinkExternalId(const QUuid &id, const QString &externalSessionId)
{
    if (externalSessionId.isEmpty()) {
        return clearExternalId(id);
    }

    Session *session = nullptr;
    bool statusReset = false;
    {
        QMutexLocker locker(&m_mutex);
        session = m_sessions.value(id, nullptr);
        if (!session) {
            return false;
        }

        const auto holder = m_externalIndex.constFind(externalSessionId);
        if (holder != m_externalIndex.constEnd()) {
            if (holder.value() == id) {
                return true;
            }
            qWarning() << "SessionManager: Cannot relink" << id << "to" << externalSessionId << "- held by" << holder.value();
            return false;
        }

        const QString current = session->externalSessionId();
        if (!current.isEmpty()) {
            m_externalIndex.remove(current);
        }
        m_externalIndex.insert(externalSessionId, id);
        session->assignExternalSessionId(externalSessionId);
        statusReset = session->assignVerificationStatus(VerificationStatus::Waiting);
        session->setVerificationSettled(false);
        session->setPotentialExternalId(QString());
    }

    qDebug() << "SessionManager: Relinked" << id << "to" << externalSessionId;
    Q_EMIT session->externalSessionIdChanged(externalSessionId);
    if (statusReset) {
        Q_EMIT session->verificationStatusChanged(VerificationStatus::Waiting);
    }
    Q_EMIT externalIdRegistered(session, externalSessionId);
    return true;
}

bool SessionManager::clearExternalId(const QUuid &id)
{
    Session *session = nullptr;
    bool statusReset = false;
    {
        QMutexLocker locker(&m_mutex);
        session = m_sessions.value(id, nullptr);
        if (!session) {
            return false;
        }
        const QString current = session->externalSessionId();
        if (current.isEmpty()) {
            return true;
        }
        m_externalIndex.remove(current);
        session->assignExternalSessionId(QString());
        statusReset = session->assignVerificationStatus(VerificationStatus::Waiting);
        session->setVerificationSettled(false);
    }

    Q_EMIT session->externalSessionIdChanged(QString());
    if (statusReset) {
        Q_EMIT session->verificationStatusChanged(VerificationStatus::Waiting);
    }
    return true;
}

bool SessionManager::applyVerifiedLink(const QUuid &id, const QString &externalSessionId, const QString &firstPrompt)
{
    if (externalSessionId.isEmpty()) {
        return false;
    }

    Session *session = nullptr;
    Session *displaced = nullptr;
    bool idChanged = false;
    bool statusChanged = false;
    {
        QMutexLocker locker(&m_mutex);
        session = m_sessions.value(id, nullptr);
        if (!session) {
            return false;
        }

        const auto holder = m_externalIndex.constFind(externalSessionId);
        if (holder != m_externalIndex.constEnd() && holder.value() != id) {
            Session *other = m_sessions.value(holder.value(), nullptr);
            if (other && other->verificationStatus() == VerificationStatus::Matched) {
                qWarning() << "SessionManager: Transcript" << externalSessionId << "is already verified for" << holder.value();
                return false;
            }
            // An unconfirmed claim yields to verified evidence
            if (other) {
                qWarning() << "SessionManager: Moving external id" << externalSessionId << "from" << holder.value() << "to verified session" << id;
                other->assignExternalSessionId(QString());
                displaced = other;
            }
            m_externalIndex.remove(externalSessionId);
        }

        const QString current = session->externalSessionId();
        if (!current.isEmpty() && current != externalSessionId) {
            m_externalIndex.remove(current);
        }
        m_externalIndex.insert(externalSessionId, id);
        idChanged = session->assignExternalSessionId(externalSessionId);
        statusChanged = session->assignVerificationStatus(VerificationStatus::Matched);
        session->setVerificationSettled(true);
        session->setPotentialExternalId(QString());
        if (!firstPrompt.isEmpty()) {
            session->setVerifiedFirstPrompt(firstPrompt);
            if (session->expectedFirstPrompt().isEmpty()) {
                session->setExpectedFirstPrompt(firstPrompt);
            }
        }
    }

    qDebug() << "SessionManager: Verified" << id << "as" << externalSessionId;
    if (displaced) {
        Q_EMIT displaced->externalSessionIdChanged(QString());
    }
    if (idChanged) {
        Q_EMIT session->externalSessionIdChanged(externalSessionId);
        Q_EMIT externalIdRegistered(session, externalSessionId);
    }
    if (statusChanged) {
        Q_EMIT session->verificationStatusChanged(VerificationStatus::Matched);
    }
    return true;
}

void SessionManager::removeSession(const QUuid &id)
{
    Session *session = nullptr;
    {
        QMutexLocker locker(&m_mutex);
        session = m_sessions.take(id);
        if (!session) {
            return;
        }
        for (auto it = m_externalIndex.begin(); it != m_externalIndex.end();) {
            if (it.value() == id) {
                it = m_externalIndex.erase(it);
            } else {
                ++it;
            }
        }
    }

    qDebug() << "SessionManager: Removing session" << id.toString(QUuid::WithoutBraces);
    session->disconnect(this);
    // Deleting the session tears down the backend and its buffer
    session->deleteLater();
    Q_EMIT sessionRemoved(id);
}

void SessionManager::killSession(const QUuid &id)
{
    if (Session *s = session(id)) {
        s->kill(m_options.gracefulShutdownTimeoutMs());
    }
}

void SessionManager::killAllSessions()
{
    const QList<Session *> all = sessions();
    qDebug() << "SessionManager: Killing" << all.size() << "session(s)";
    for (Session *s : all) {
        s->kill(m_options.gracefulShutdownTimeoutMs());
    }
}

void SessionManager::reorderSessions(const QList<QUuid> &orderedIds)
{
    QList<Session *> current = sessions();
    QList<Session *> ordered;
    QSet<QUuid> seen;

    for (const QUuid &id : orderedIds) {
        if (seen.contains(id)) {
            continue;
        }
        if (Session *s = session(id)) {
            ordered.append(s);
            seen.insert(id);
        }
    }
    for (Session *s : std::as_const(current)) {
        if (!seen.contains(s->id())) {
            ordered.append(s);
        }
    }

    for (int i = 0; i < ordered.size(); ++i) {
        ordered.at(i)->setSortOrder(i);
    }
}

void SessionManager::rebuildExternalIndex()
{
    QMutexLocker locker(&m_mutex);
    m_externalIndex.clear();

    QList<Session *> list = m_sessions.values();
    std::stable_sort(list.begin(), list.end(), [](Session *a, Session *b) {
        return a->sortOrder() < b->sortOrder();
    });
    for (Session *s : std::as_const(list)) {
        const QString externalId = s->externalSessionId();
        if (externalId.isEmpty()) {
            continue;
        }
        if (m_externalIndex.contains(externalId)) {
            qWarning() << "SessionManager: Duplicate external id" << externalId << "while rebuilding index";
            continue;
        }
        m_externalIndex.insert(externalId, s->id());
    }
}

bool SessionManager::saveState(const SessionStore &store) const
{
    QList<PersistedSession> records;
    for (Session *s : sessions()) {
        const ProcessStatus status = s->processStatus();
        const bool live = status == ProcessStatus::Starting || status == ProcessStatus::Running || status == ProcessStatus::Exiting;
        if (!live && s->externalSessionId().isEmpty()) {
            continue;
        }
        records.append(s->snapshot());
    }

    qDebug() << "SessionManager: Saving" << records.size() << "session(s) to" << store.filePath();
    return store.save(records);
}

QList<PersistedSession> SessionManager::deduplicateExternalIds(QList<PersistedSession> sessions)
{
    QSet<QString> claimed;
    for (PersistedSession &state : sessions) {
        if (state.externalSessionId.isEmpty()) {
            continue;
        }
        if (claimed.contains(state.externalSessionId)) {
            qWarning() << "SessionManager: Session" << state.id << "also claims" << state.externalSessionId << "- clearing it for re-verification";
            state.externalSessionId.clear();
            state.verificationStatus = VerificationStatus::Waiting;
            continue;
        }
        claimed.insert(state.externalSessionId);
    }
    return sessions;
}

QList<PersistedSession> SessionManager::loadState(const SessionStore &store, SessionStore::LoadResult *loadResult) const
{
    SessionStore::LoadResult result = store.loadResult();
    QList<PersistedSession> records = std::move(result.sessions);
    result.sessions.clear();
    if (loadResult) {
        *loadResult = result;
    }

    std::stable_sort(records.begin(), records.end(), [](const PersistedSession &a, const PersistedSession &b) {
        return a.sortOrder < b.sortOrder;
    });
    return deduplicateExternalIds(records);
}

Session *SessionManager::restoreSession(const PersistedSession &state, QString *errorMessage)
{
    if (!state.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid session record");
        }
        return nullptr;
    }
    if (session(state.id)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Session %1 already exists").arg(state.id.toString(QUuid::WithoutBraces));
        }
        return nullptr;
    }

    SessionOptions options;
    options.workingDirectory = state.workingDirectory;
    options.kind = state.backendKind;
    options.arguments = state.claudeArgs;
    options.resumeExternalId = state.externalSessionId;
    options.expectedFirstPrompt = state.expectedFirstPrompt;
    options.externalProcessId = state.processId;
    options.windowHandle = state.windowHandle;

    return launch(state.id, state.createdAt, options, &state, errorMessage);
}

SessionManager::RestoreResult SessionManager::restoreState(const SessionStore &store)
{
    RestoreResult result;

    SessionStore::LoadResult loaded;
    const QList<PersistedSession> records = loadState(store, &loaded);
    if (!loaded.success) {
        result.success = false;
        result.fileExistedButFailed = loaded.fileExistedButFailed;
        result.errorMessage = loaded.errorMessage;
        // Keep the unreadable file before the next save replaces it
        if (loaded.fileExistedButFailed) {
            if (store.backup()) {
                result.backupPath = store.backupFilePath();
                qWarning() << "SessionManager: Unreadable state saved as" << result.backupPath;
            } else {
                qWarning() << "SessionManager: Could not back up unreadable state" << store.filePath();
            }
        }
        return result;
    }

    for (const PersistedSession &state : records) {
        QString error;
        if (restoreSession(state, &error)) {
            ++result.restoredCount;
        } else {
            ++result.failedCount;
            qWarning() << "SessionManager: Could not restore" << state.id << error;
        }
    }
    scanForOrphans();
    rebuildExternalIndex();
    qDebug() << "SessionManager: Restored" << result.restoredCount << "of" << records.size() << "session(s)";
    return result;
}

int SessionManager::scanForOrphans()
{
    int orphaned = 0;
    for (Session *s : sessions()) {
        SessionBackend *backend = s->backend();
        // A stateless backend has no long-lived process to lose
        if (backend->kind() == BackendKind::Stateless || backend->hasExited()) {
            continue;
        }
        const qint64 pid = backend->processId();
        if (pid <= 0 || ExternalBackend::processExists(pid)) {
            continue;
        }
        qWarning() << "SessionManager: Session" << s->id() << "lost its process" << pid;
        backend->abandon();
        ++orphaned;
    }
    return orphaned;
}

} // namespace Conductor

#include "moc_SessionManager.cpp"
