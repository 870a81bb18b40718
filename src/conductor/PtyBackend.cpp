/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyBackend.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStandardPaths>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Conductor
{

PtyBackend::PtyBackend(int bufferCapacity, QObject *parent)
    : SessionBackend(bufferCapacity, parent)
{
    m_exitPollTimer.setInterval(ExitPollIntervalMs);
    connect(&m_exitPollTimer, &QTimer::timeout, this, &PtyBackend::checkChildExited);

    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, &PtyBackend::forceKill);
}

PtyBackend::~PtyBackend()
{
    m_exitPollTimer.stop();
    m_killTimer.stop();

    if (m_pid > 0 && !hasExited()) {
        ::kill(static_cast<pid_t>(m_pid), SIGKILL);
        int status = 0;
        ::waitpid(static_cast<pid_t>(m_pid), &status, 0);
    }
    closeMaster();
}

bool PtyBackend::start(const LaunchSpec &spec, QString *errorMessage)
{
    if (m_pid > 0 || hasExited()) {
        setError(errorMessage, QStringLiteral("Backend already started"));
        return false;
    }
    if (!validateWorkingDirectory(spec.workingDirectory, errorMessage)) {
        return false;
    }
    if (spec.columns <= 0 || spec.rows <= 0) {
        setError(errorMessage, QStringLiteral("Invalid terminal size %1x%2").arg(spec.columns).arg(spec.rows));
        return false;
    }

    QString program = spec.executable;
    if (!program.contains(QLatin1Char('/'))) {
        program = QStandardPaths::findExecutable(spec.executable);
    }
    if (program.isEmpty() || !QFileInfo(program).isExecutable()) {
        qWarning() << "PtyBackend: Executable not found:" << spec.executable;
        setError(errorMessage, QStringLiteral("Executable not found: %1").arg(spec.executable));
        reportExit(-1, ProcessStatus::Failed);
        return false;
    }

    // Everything the child touches is prepared before fork
    std::vector<QByteArray> argStorage;
    argStorage.reserve(spec.arguments.size() + 1);
    argStorage.push_back(QFile::encodeName(program));
    for (const QString &arg : spec.arguments) {
        argStorage.push_back(arg.toLocal8Bit());
    }
    std::vector<char *> argv;
    argv.reserve(argStorage.size() + 1);
    for (QByteArray &arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("TERM"), QStringLiteral("xterm-256color"));
    const QStringList environmentEntries = environment.toStringList();
    std::vector<QByteArray> envStorage;
    envStorage.reserve(environmentEntries.size());
    for (const QString &entry : environmentEntries) {
        envStorage.push_back(entry.toLocal8Bit());
    }
    std::vector<char *> envp;
    envp.reserve(envStorage.size() + 1);
    for (QByteArray &entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const QByteArray workDir = QFile::encodeName(spec.workingDirectory);

    // Reports exec failure from the child; closes on successful exec
    int execPipe[2];
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        const QString reason = QString::fromLocal8Bit(std::strerror(errno));
        setError(errorMessage, QStringLiteral("pipe2 failed: %1").arg(reason));
        reportExit(-1, ProcessStatus::Failed);
        return false;
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(spec.columns);
    ws.ws_row = static_cast<unsigned short>(spec.rows);

    int masterFd = -1;
    const pid_t pid = ::forkpty(&masterFd, nullptr, nullptr, &ws);
    if (pid < 0) {
        const QString reason = QString::fromLocal8Bit(std::strerror(errno));
        ::close(execPipe[0]);
        ::close(execPipe[1]);
        qWarning() << "PtyBackend: forkpty failed:" << reason;
        setError(errorMessage, QStringLiteral("forkpty failed: %1").arg(reason));
        reportExit(-1, ProcessStatus::Failed);
        return false;
    }

    // Only async-signal-safe calls until exec
    if (pid == 0) {
        ::close(execPipe[0]);
        if (::chdir(workDir.constData()) == 0) {
            ::execve(argv[0], argv.data(), envp.data());
        }
        const int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(execPipe[1]);
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n == sizeof(childErrno)) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(masterFd);
        const QString reason = QString::fromLocal8Bit(std::strerror(childErrno));
        qWarning() << "PtyBackend: Failed to exec" << program << reason;
        setError(errorMessage, QStringLiteral("Failed to start %1: %2").arg(program, reason));
        reportExit(127, ProcessStatus::Failed);
        return false;
    }

    const int flags = ::fcntl(masterFd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(masterFd, F_SETFL, flags | O_NONBLOCK);
    }

    m_masterFd = masterFd;
    m_pid = pid;
    m_columns = spec.columns;
    m_rows = spec.rows;

    m_readNotifier = new QSocketNotifier(m_masterFd, QSocketNotifier::Read, this);
    connect(m_readNotifier, &QSocketNotifier::activated, this, &PtyBackend::onMasterReadable);

    setProcessId(pid);
    setStatus(ProcessStatus::Running);
    m_exitPollTimer.start();

    qDebug() << "PtyBackend: Started" << program << "pid" << pid << "in" << spec.workingDirectory;
    return true;
}

void PtyBackend::write(const QByteArray &data)
{
    if (m_masterFd < 0 || data.isEmpty()) {
        return;
    }

    if (!m_pendingWrite.isEmpty()) {
        m_pendingWrite.append(data);
        return;
    }

    const char *ptr = data.constData();
    qsizetype remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(m_masterFd, ptr, static_cast<size_t>(remaining));
        if (written > 0) {
            ptr += written;
            remaining -= written;
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            m_pendingWrite = QByteArray(ptr, remaining);
            if (!m_writeNotifier) {
                m_writeNotifier = new QSocketNotifier(m_masterFd, QSocketNotifier::Write, this);
                connect(m_writeNotifier, &QSocketNotifier::activated, this, &PtyBackend::onMasterWritable);
            }
            m_writeNotifier->setEnabled(true);
            return;
        }
        qWarning() << "PtyBackend: Write to pty failed:" << std::strerror(errno);
        return;
    }
}

void PtyBackend::onMasterWritable()
{
    QByteArray pending;
    pending.swap(m_pendingWrite);
    m_writeNotifier->setEnabled(false);
    write(pending);
}

void PtyBackend::resize(int columns, int rows)
{
    if (columns <= 0 || rows <= 0) {
        qWarning() << "PtyBackend: Ignoring invalid size" << columns << "x" << rows;
        return;
    }
    m_columns = columns;
    m_rows = rows;
    if (m_masterFd < 0) {
        return;
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(columns);
    ws.ws_row = static_cast<unsigned short>(rows);
    if (::ioctl(m_masterFd, TIOCSWINSZ, &ws) != 0) {
        qWarning() << "PtyBackend: TIOCSWINSZ failed:" << std::strerror(errno);
    }
}

void PtyBackend::gracefulShutdown(int timeoutMs)
{
    if (hasExited() || m_pid <= 0 || status() == ProcessStatus::Exiting) {
        return;
    }

    qDebug() << "PtyBackend: Shutting down pid" << m_pid << "timeout" << timeoutMs;
    setStatus(ProcessStatus::Exiting);

    // Ctrl+C for the agent, then hang up the terminal as a closing emulator would
    write(QByteArrayLiteral("\x03"));
    ::kill(static_cast<pid_t>(m_pid), SIGHUP);
    ::kill(static_cast<pid_t>(m_pid), SIGTERM);

    m_killTimer.start(qMax(0, timeoutMs));
}

void PtyBackend::forceKill()
{
    if (hasExited() || m_pid <= 0) {
        return;
    }
    qWarning() << "PtyBackend: pid" << m_pid << "ignored shutdown, sending SIGKILL";
    ::kill(static_cast<pid_t>(m_pid), SIGKILL);
}

void PtyBackend::onMasterReadable()
{
    if (drainMaster()) {
        // The slave side is gone, reap the child now instead of on the next poll
        if (m_readNotifier) {
            m_readNotifier->setEnabled(false);
        }
        checkChildExited();
    }
}

bool PtyBackend::drainMaster()
{
    if (m_masterFd < 0) {
        return true;
    }

    char chunk[4096];
    for (;;) {
        const ssize_t n = ::read(m_masterFd, chunk, sizeof(chunk));
        if (n > 0) {
            if (buffer()) {
                buffer()->write(chunk, static_cast<int>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return false;
        }
        // EOF, or EIO once the last slave descriptor closes
        return true;
    }
}

void PtyBackend::checkChildExited()
{
    if (m_pid <= 0 || hasExited()) {
        return;
    }

    int status = 0;
    const pid_t result = ::waitpid(static_cast<pid_t>(m_pid), &status, WNOHANG);
    if (result == 0) {
        return;
    }
    if (result < 0 && errno != ECHILD) {
        qWarning() << "PtyBackend: waitpid failed:" << std::strerror(errno);
        return;
    }
    finishExit(result < 0 ? -1 : status);
}

void PtyBackend::finishExit(int waitStatus)
{
    m_exitPollTimer.stop();
    m_killTimer.stop();

    // Output written just before exit is still queued on the master
    drainMaster();
    closeMaster();

    int code = -1;
    if (waitStatus >= 0) {
        if (WIFEXITED(waitStatus)) {
            code = WEXITSTATUS(waitStatus);
        } else if (WIFSIGNALED(waitStatus)) {
            code = 128 + WTERMSIG(waitStatus);
        }
    }
    reportExit(code);
}

void PtyBackend::closeMaster()
{
    delete m_readNotifier;
    m_readNotifier = nullptr;
    delete m_writeNotifier;
    m_writeNotifier = nullptr;
    m_pendingWrite.clear();

    if (m_masterFd >= 0) {
        ::close(m_masterFd);
        m_masterFd = -1;
    }
}

} // namespace Conductor

#include "moc_PtyBackend.cpp"
