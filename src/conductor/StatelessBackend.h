/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATELESSBACKEND_H
#define STATELESSBACKEND_H

#include "SessionBackend.h"

#include <QPointer>
#include <QProcess>
#include <QTimer>

namespace Conductor
{

/**
 * StatelessBackend runs one process per prompt.
 *
 * Each sendText() spawns the launch executable with the launch arguments
 * (plus "--resume <id>" once the agent's session id is known), feeds the
 * prompt on stdin and copies stdout into the buffer. Only one exchange
 * runs at a time; a prompt sent while busy is rejected.
 *
 * processId() is the pid of the latest exchange. processExited() fires
 * only when the backend itself is shut down.
 */
class CONDUCTOR_EXPORT StatelessBackend : public SessionBackend
{
    Q_OBJECT

public:
    explicit StatelessBackend(int bufferCapacity = TerminalBuffer::DefaultCapacity, QObject *parent = nullptr);
    ~StatelessBackend() override;

    BackendKind kind() const override { return BackendKind::Stateless; }

    bool start(const LaunchSpec &spec, QString *errorMessage = nullptr) override;

    /**
     * Raw bytes have nowhere to go between exchanges; ignored.
     */
    void write(const QByteArray &data) override;

    void sendText(const QString &text, std::function<void(bool)> done = {}) override;

    /**
     * Cancel the exchange in flight, if any
     */
    void interrupt() override;

    void resize(int columns, int rows) override;
    void gracefulShutdown(int timeoutMs) override;

    bool isBusy() const override { return m_current != nullptr; }

    QString resumeSessionId() const { return m_resumeSessionId; }
    void setResumeSessionId(const QString &id) { m_resumeSessionId = id; }

    /**
     * Arguments for the next exchange
     */
    QStringList exchangeArguments() const;

Q_SIGNALS:
    void exchangeStarted(qint64 pid);
    void exchangeFinished(int exitCode);

private Q_SLOTS:
    void onExchangeStarted();
    void onReadyReadStandardOutput();
    void onExchangeFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onExchangeError(QProcess::ProcessError error);

private:
    void finishShutdown();
    void completePending(bool ok);

    LaunchSpec m_spec;
    QString m_resumeSessionId;
    QProcess *m_current = nullptr;
    std::function<void(bool)> m_pendingDone;
    QByteArray m_pendingText;
    bool m_started = false;
    bool m_shuttingDown = false;
    QTimer m_killTimer;
};

} // namespace Conductor

#endif // STATELESSBACKEND_H
