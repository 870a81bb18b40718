/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Session.h"

#include "ExternalBackend.h"
#include "StatelessBackend.h"

#include <QDebug>
#include <QMutexLocker>
#include <QPointer>

namespace Conductor
{

Session::Session(const QUuid &id, const QString &workingDirectory, SessionBackend *backend, const QDateTime &createdAt, QObject *parent)
    : QObject(parent)
    , m_id(id)
    , m_workingDirectory(workingDirectory)
    , m_createdAt(createdAt.isValid() ? createdAt : QDateTime::currentDateTimeUtc())
    , m_backend(backend)
    , m_activity(new ActivityStateMachine(this))
    , m_promptQueue(new PromptQueue(this))
{
    Q_ASSERT(m_backend);
    m_backend->setParent(this);

    connect(m_activity, &ActivityStateMachine::stateChanged, this, &Session::activityStateChanged);
    connect(m_backend, &SessionBackend::statusChanged, this, &Session::processStatusChanged);
    connect(m_backend, &SessionBackend::processExited, this, [this](int exitCode) {
        qDebug() << "Session:" << m_id.toString(QUuid::WithoutBraces) << "process exited with" << exitCode;
        m_activity->applyProcessExit();
        Q_EMIT processExited(exitCode);
    });
}

Session::~Session() = default;

QString Session::externalSessionId() const
{
    QMutexLocker locker(&m_mutex);
    return m_externalSessionId;
}

void Session::setExternalSessionId(const QString &externalSessionId)
{
    if (assignExternalSessionId(externalSessionId)) {
        Q_EMIT externalSessionIdChanged(externalSessionId);
    }
}

bool Session::assignExternalSessionId(const QString &externalSessionId)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_externalSessionId == externalSessionId) {
            return false;
        }
        m_externalSessionId = externalSessionId;
    }

    if (auto *stateless = qobject_cast<StatelessBackend *>(m_backend)) {
        stateless->setResumeSessionId(externalSessionId);
    }
    return true;
}

VerificationStatus Session::verificationStatus() const
{
    QMutexLocker locker(&m_mutex);
    return m_verificationStatus;
}

void Session::setVerificationStatus(VerificationStatus status)
{
    if (assignVerificationStatus(status)) {
        Q_EMIT verificationStatusChanged(status);
    }
}

bool Session::assignVerificationStatus(VerificationStatus status)
{
    QMutexLocker locker(&m_mutex);
    if (m_verificationStatus == status) {
        return false;
    }
    m_verificationStatus = status;
    return true;
}

QString Session::potentialExternalId() const
{
    QMutexLocker locker(&m_mutex);
    return m_potentialExternalId;
}

void Session::setPotentialExternalId(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    m_potentialExternalId = id;
}

QString Session::expectedFirstPrompt() const
{
    QMutexLocker locker(&m_mutex);
    return m_expectedFirstPrompt;
}

void Session::setExpectedFirstPrompt(const QString &prompt)
{
    QMutexLocker locker(&m_mutex);
    m_expectedFirstPrompt = prompt;
}

QString Session::verifiedFirstPrompt() const
{
    QMutexLocker locker(&m_mutex);
    return m_verifiedFirstPrompt;
}

void Session::setVerifiedFirstPrompt(const QString &prompt)
{
    QMutexLocker locker(&m_mutex);
    m_verifiedFirstPrompt = prompt;
}

bool Session::tryBeginVerification()
{
    return m_verificationRunning.testAndSetAcquire(0, 1);
}

void Session::endVerification()
{
    m_verificationRunning.storeRelease(0);
}

bool Session::isVerificationSettled() const
{
    QMutexLocker locker(&m_mutex);
    return m_verificationSettled;
}

void Session::setVerificationSettled(bool settled)
{
    QMutexLocker locker(&m_mutex);
    m_verificationSettled = settled;
}

QString Session::customName() const
{
    QMutexLocker locker(&m_mutex);
    return m_customName;
}

void Session::setCustomName(const QString &name)
{
    {
        QMutexLocker locker(&m_mutex);
        m_customName = name;
    }
    Q_EMIT metadataChanged();
}

QString Session::customColor() const
{
    QMutexLocker locker(&m_mutex);
    return m_customColor;
}

void Session::setCustomColor(const QString &color)
{
    {
        QMutexLocker locker(&m_mutex);
        m_customColor = color;
    }
    Q_EMIT metadataChanged();
}

QString Session::pendingPromptText() const
{
    QMutexLocker locker(&m_mutex);
    return m_pendingPromptText;
}

void Session::setPendingPromptText(const QString &text)
{
    QMutexLocker locker(&m_mutex);
    m_pendingPromptText = text;
}

int Session::sortOrder() const
{
    QMutexLocker locker(&m_mutex);
    return m_sortOrder;
}

void Session::setSortOrder(int order)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_sortOrder == order) {
            return;
        }
        m_sortOrder = order;
    }
    Q_EMIT metadataChanged();
}

void Session::sendInput(const QByteArray &data)
{
    if (m_backend->hasExited()) {
        return;
    }
    m_backend->write(data);
}

void Session::sendText(const QString &text, std::function<void(bool)> done)
{
    if (m_backend->hasExited()) {
        if (done) {
            done(false);
        }
        return;
    }
    m_backend->sendText(text, std::move(done));
}

bool Session::sendQueuedPrompt(const QUuid &itemId)
{
    if (!m_backend->isRunning() || m_backend->isBusy()) {
        return false;
    }
    const int index = m_promptQueue->indexOf(itemId);
    const PromptQueueItem item = m_promptQueue->take(itemId);
    if (!item.isValid()) {
        return false;
    }

    // A send that fails later puts the prompt back where it was
    QPointer<PromptQueue> queue(m_promptQueue);
    sendText(item.text, [queue, index, item](bool ok) {
        if (!ok && queue) {
            qWarning() << "Session: Queued prompt was not delivered, keeping it queued";
            queue->insert(index, item);
        }
    });
    return true;
}

void Session::interrupt()
{
    if (!m_backend->hasExited()) {
        m_backend->interrupt();
    }
}

void Session::resize(int columns, int rows)
{
    if (!m_backend->hasExited()) {
        m_backend->resize(columns, rows);
    }
}

void Session::kill(int timeoutMs)
{
    if (m_backend->hasExited()) {
        return;
    }
    qDebug() << "Session: Killing" << m_id.toString(QUuid::WithoutBraces);
    m_backend->gracefulShutdown(timeoutMs);
}

void Session::handleHookEvent(const HookEvent &event)
{
    m_activity->apply(event);
}

PersistedSession Session::snapshot() const
{
    PersistedSession state;
    state.id = m_id;
    state.workingDirectory = m_workingDirectory;
    state.backendKind = m_backend->kind();
    state.createdAt = m_createdAt;
    state.activityState = m_activity->state();
    state.queuedPrompts = m_promptQueue->items();
    state.claudeArgs = m_launchArguments;
    state.processId = m_backend->processId();

    if (auto *external = qobject_cast<ExternalBackend *>(m_backend)) {
        state.windowHandle = external->windowHandle();
    }

    QMutexLocker locker(&m_mutex);
    state.externalSessionId = m_externalSessionId;
    state.verificationStatus = m_verificationStatus;
    state.expectedFirstPrompt = m_expectedFirstPrompt;
    state.verifiedFirstPrompt = m_verifiedFirstPrompt;
    state.potentialExternalId = m_potentialExternalId;
    state.customName = m_customName;
    state.customColor = m_customColor;
    state.pendingPromptText = m_pendingPromptText;
    state.sortOrder = m_sortOrder;
    return state;
}

void Session::applySnapshot(const PersistedSession &state)
{
    {
        QMutexLocker locker(&m_mutex);
        m_customName = state.customName;
        m_customColor = state.customColor;
        m_pendingPromptText = state.pendingPromptText;
        m_sortOrder = state.sortOrder;
        m_expectedFirstPrompt = state.expectedFirstPrompt;
        m_verifiedFirstPrompt = state.verifiedFirstPrompt;
        m_potentialExternalId = state.potentialExternalId;
        // A confirmed link stays confirmed across restarts
        if (state.verificationStatus == VerificationStatus::Matched && !state.externalSessionId.isEmpty()) {
            m_verificationStatus = VerificationStatus::Matched;
            m_verificationSettled = true;
        }
    }
    m_launchArguments = state.claudeArgs;
    m_promptQueue->loadFrom(state.queuedPrompts);
    Q_EMIT metadataChanged();
}

} // namespace Conductor

#include "moc_Session.cpp"
