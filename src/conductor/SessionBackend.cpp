/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionBackend.h"

#include <QDebug>
#include <QFileInfo>
#include <QMutexLocker>
#include <QPointer>
#include <QTimer>

namespace Conductor
{

SessionBackend::SessionBackend(int bufferCapacity, QObject *parent)
    : QObject(parent)
{
    if (bufferCapacity != 0) {
        m_buffer = std::make_unique<TerminalBuffer>(bufferCapacity);
    }
}

SessionBackend::~SessionBackend() = default;

bool SessionBackend::validateWorkingDirectory(const QString &path, QString *errorMessage)
{
    if (path.isEmpty()) {
        setError(errorMessage, QStringLiteral("Working directory is empty"));
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists() || !info.isDir()) {
        setError(errorMessage, QStringLiteral("Working directory not found: %1").arg(path));
        return false;
    }
    return true;
}

void SessionBackend::setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

void SessionBackend::sendText(const QString &text, std::function<void(bool)> done)
{
    if (!isRunning()) {
        qWarning() << "SessionBackend: sendText on a backend that is not running";
        if (done) {
            done(false);
        }
        return;
    }

    write(text.toUtf8());

    // TUIs treat a burst ending in CR as a paste, so Enter goes separately
    QPointer<SessionBackend> self(this);
    QTimer::singleShot(EnterKeyDelayMs, this, [self, done]() {
        if (!self || !self->isRunning()) {
            if (done) {
                done(false);
            }
            return;
        }
        self->write(QByteArrayLiteral("\r"));
        if (done) {
            done(true);
        }
    });
}

void SessionBackend::interrupt()
{
    write(QByteArrayLiteral("\x03"));
}

void SessionBackend::abandon()
{
    qWarning() << "SessionBackend: Process" << processId() << "is gone";
    reportExit(-1, ProcessStatus::Failed);
}

qint64 SessionBackend::processId() const
{
    QMutexLocker locker(&m_mutex);
    return m_processId;
}

ProcessStatus SessionBackend::status() const
{
    QMutexLocker locker(&m_mutex);
    return m_status;
}

int SessionBackend::exitCode() const
{
    QMutexLocker locker(&m_mutex);
    return m_exitCode;
}

bool SessionBackend::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_status == ProcessStatus::Running;
}

bool SessionBackend::hasExited() const
{
    QMutexLocker locker(&m_mutex);
    return m_exitReported;
}

void SessionBackend::setStatus(ProcessStatus status)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_status == status || m_exitReported) {
            return;
        }
        m_status = status;
    }
    Q_EMIT statusChanged(status);
}

void SessionBackend::setProcessId(qint64 pid)
{
    QMutexLocker locker(&m_mutex);
    m_processId = pid;
}

void SessionBackend::reportExit(int exitCode, ProcessStatus finalStatus)
{
    bool statusChangedNow = false;
    {
        QMutexLocker locker(&m_mutex);
        if (m_exitReported) {
            return;
        }
        m_exitReported = true;
        m_exitCode = exitCode;
        statusChangedNow = m_status != finalStatus;
        m_status = finalStatus;
    }

    qDebug() << "SessionBackend: Process exited with code" << exitCode << "status" << toString(finalStatus);
    if (statusChangedNow) {
        Q_EMIT statusChanged(finalStatus);
    }
    Q_EMIT processExited(exitCode);
}

} // namespace Conductor

#include "moc_SessionBackend.cpp"
