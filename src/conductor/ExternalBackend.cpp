/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ExternalBackend.h"

#include <QDebug>

#include <cerrno>
#include <csignal>

#include <sys/types.h>

namespace Conductor
{

ExternalBackend::ExternalBackend(qint64 processId, qint64 windowHandle, int bufferCapacity, QObject *parent)
    : SessionBackend(bufferCapacity, parent)
    , m_windowHandle(windowHandle)
{
    setProcessId(processId);

    m_livenessTimer.setInterval(LivenessPollIntervalMs);
    connect(&m_livenessTimer, &QTimer::timeout, this, &ExternalBackend::checkAlive);

    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        const qint64 pid = processId();
        if (!hasExited() && processExists(pid)) {
            qWarning() << "ExternalBackend: pid" << pid << "ignored SIGTERM, sending SIGKILL";
            ::kill(static_cast<pid_t>(pid), SIGKILL);
        }
    });
}

ExternalBackend::~ExternalBackend() = default;

bool ExternalBackend::processExists(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    // EPERM still means the process exists
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

bool ExternalBackend::start(const LaunchSpec &spec, QString *errorMessage)
{
    if (m_started) {
        setError(errorMessage, QStringLiteral("Backend already started"));
        return false;
    }
    if (!validateWorkingDirectory(spec.workingDirectory, errorMessage)) {
        return false;
    }

    m_started = true;
    setStatus(ProcessStatus::Running);
    if (processId() > 0) {
        m_livenessTimer.start();
    }
    qDebug() << "ExternalBackend: Attached to pid" << processId() << "window" << m_windowHandle;
    return true;
}

void ExternalBackend::attachProcess(qint64 processId)
{
    setProcessId(processId);
    if (m_started && processId > 0 && !hasExited()) {
        m_livenessTimer.start();
    }
}

void ExternalBackend::write(const QByteArray &data)
{
    if (m_inputHandler && !hasExited()) {
        m_inputHandler(data);
    }
}

void ExternalBackend::resize(int columns, int rows)
{
    if (m_resizeHandler && columns > 0 && rows > 0) {
        m_resizeHandler(columns, rows);
    }
}

void ExternalBackend::gracefulShutdown(int timeoutMs)
{
    if (hasExited() || status() == ProcessStatus::Exiting) {
        return;
    }

    setStatus(ProcessStatus::Exiting);

    const qint64 pid = processId();
    if (!processExists(pid)) {
        m_livenessTimer.stop();
        reportExit(0);
        return;
    }

    interrupt();
    ::kill(static_cast<pid_t>(pid), SIGTERM);

    // Exit is observed by the liveness poll, which runs faster while shutting down
    m_livenessTimer.start(100);
    m_killTimer.start(qMax(0, timeoutMs));
}

void ExternalBackend::checkAlive()
{
    if (hasExited()) {
        m_livenessTimer.stop();
        return;
    }
    if (processExists(processId())) {
        return;
    }

    m_livenessTimer.stop();
    m_killTimer.stop();
    // The exit status of a process we did not spawn is not available
    reportExit(0);
}

} // namespace Conductor

#include "moc_ExternalBackend.cpp"
