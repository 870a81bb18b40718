/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STUBBACKEND_H
#define STUBBACKEND_H

#include "../conductor/SessionBackend.h"
#include "../conductor/TerminalBuffer.h"

namespace Conductor
{

/**
 * In-process backend for tests. Nothing is spawned; output and exits are
 * driven by the test.
 */
class StubBackend : public SessionBackend
{
public:
    explicit StubBackend(BackendKind kind = BackendKind::Pty, qint64 pid = 0, int bufferCapacity = 64 * 1024)
        : SessionBackend(bufferCapacity)
        , m_kind(kind)
        , m_pid(pid)
    {
    }

    BackendKind kind() const override
    {
        return m_kind;
    }

    bool start(const LaunchSpec &spec, QString *errorMessage = nullptr) override
    {
        if (!validateWorkingDirectory(spec.workingDirectory, errorMessage)) {
            return false;
        }
        lastSpec = spec;
        if (failStart) {
            setError(errorMessage, QStringLiteral("stub refused to start"));
            reportExit(-1, ProcessStatus::Failed);
            return false;
        }
        setProcessId(m_pid);
        setStatus(ProcessStatus::Running);
        return true;
    }

    void write(const QByteArray &data) override
    {
        written += data;
    }

    void sendText(const QString &text, std::function<void(bool)> done = {}) override
    {
        if (rejectSends) {
            if (done) {
                done(false);
            }
            return;
        }
        SessionBackend::sendText(text, std::move(done));
    }

    bool isBusy() const override
    {
        return busy;
    }

    void resize(int newColumns, int newRows) override
    {
        columns = newColumns;
        rows = newRows;
    }

    void gracefulShutdown(int timeoutMs) override
    {
        if (hasExited()) {
            return;
        }
        ++shutdownRequests;
        lastShutdownTimeout = timeoutMs;
        setStatus(ProcessStatus::Exiting);
        reportExit(0);
    }

    void emitOutput(const QByteArray &data)
    {
        if (buffer()) {
            buffer()->write(data);
        }
    }

    void finish(int exitCode)
    {
        reportExit(exitCode);
    }

    LaunchSpec lastSpec;
    QByteArray written;
    bool failStart = false;
    bool busy = false;
    bool rejectSends = false;
    int columns = 0;
    int rows = 0;
    int shutdownRequests = 0;
    int lastShutdownTimeout = 0;

private:
    BackendKind m_kind;
    qint64 m_pid;
};

}

#endif // STUBBACKEND_H
