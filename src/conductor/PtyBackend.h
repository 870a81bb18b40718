/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYBACKEND_H
#define PTYBACKEND_H

#include "SessionBackend.h"

#include <QPointer>
#include <QSocketNotifier>
#include <QTimer>

namespace Conductor
{

/**
 * PtyBackend runs the agent on a pseudo-terminal it owns.
 *
 * The master side is non-blocking and watched by a QSocketNotifier; every
 * byte the child prints lands in the terminal buffer. The child is reaped
 * with waitpid(WNOHANG) from a poll timer, so exit is noticed even when
 * the child leaves the slave side open through a grandchild.
 */
class CONDUCTOR_EXPORT PtyBackend : public SessionBackend
{
    Q_OBJECT

public:
    explicit PtyBackend(int bufferCapacity = TerminalBuffer::DefaultCapacity, QObject *parent = nullptr);
    ~PtyBackend() override;

    BackendKind kind() const override { return BackendKind::Pty; }

    bool start(const LaunchSpec &spec, QString *errorMessage = nullptr) override;
    void write(const QByteArray &data) override;
    void resize(int columns, int rows) override;
    void gracefulShutdown(int timeoutMs) override;

    int columns() const { return m_columns; }
    int rows() const { return m_rows; }

    static constexpr int ExitPollIntervalMs = 100;

private Q_SLOTS:
    void onMasterReadable();
    void onMasterWritable();
    void checkChildExited();
    void forceKill();

private:
    bool drainMaster();
    void closeMaster();
    void finishExit(int waitStatus);

    int m_masterFd = -1;
    qint64 m_pid = 0;
    int m_columns = 0;
    int m_rows = 0;
    QByteArray m_pendingWrite;
    QSocketNotifier *m_readNotifier = nullptr;
    QSocketNotifier *m_writeNotifier = nullptr;
    QTimer m_exitPollTimer;
    QTimer m_killTimer;
};

} // namespace Conductor

#endif // PTYBACKEND_H
