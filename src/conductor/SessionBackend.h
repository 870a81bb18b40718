/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONBACKEND_H
#define SESSIONBACKEND_H

#include "conductor_export.h"

#include "SessionTypes.h"
#include "TerminalBuffer.h"

#include <QByteArray>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

namespace Conductor
{

/**
 * What to run and where
 */
struct CONDUCTOR_EXPORT LaunchSpec {
    QString executable;
    QStringList arguments;
    QString workingDirectory;
    int columns = 120;
    int rows = 30;
};

/**
 * SessionBackend owns the process behind a session.
 *
 * Implementations are interchangeable from the Session's point of view.
 * The lifecycle is observed through statusChanged() and processExited();
 * processExited() fires exactly once per backend, whether the process
 * ended on its own, was shut down, or failed to spawn.
 */
class CONDUCTOR_EXPORT SessionBackend : public QObject
{
    Q_OBJECT

public:
    ~SessionBackend() override;

    virtual BackendKind kind() const = 0;

    /**
     * Start the backend.
     *
     * An invalid working directory is rejected before anything is spawned.
     * A spawn failure sets status() to Failed and emits processExited().
     *
     * @return true if the backend is running
     */
    virtual bool start(const LaunchSpec &spec, QString *errorMessage = nullptr) = 0;

    /**
     * Write raw bytes to the process input
     */
    virtual void write(const QByteArray &data) = 0;

    /**
     * Type @p text followed by Enter. @p done is invoked once the input
     * has been handed over, with false if the backend could not take it.
     */
    virtual void sendText(const QString &text, std::function<void(bool)> done = {});

    /**
     * Ask the agent to stop what it is doing (Ctrl+C)
     */
    virtual void interrupt();

    virtual void resize(int columns, int rows) = 0;

    /**
     * True while the backend cannot take new text, e.g. a one-shot
     * exchange is still in flight
     */
    virtual bool isBusy() const
    {
        return false;
    }

    /**
     * Ask the process to exit and force it after @p timeoutMs.
     * Does nothing once the backend has exited.
     */
    virtual void gracefulShutdown(int timeoutMs) = 0;

    /**
     * Record that the process vanished without us observing it,
     * e.g. a recorded pid that no longer exists after a restart.
     */
    void abandon();

    qint64 processId() const;
    ProcessStatus status() const;
    int exitCode() const;
    bool isRunning() const;
    bool hasExited() const;

    /**
     * Terminal output, or nullptr for backends that have none
     */
    TerminalBuffer *buffer() const { return m_buffer.get(); }

    /**
     * Check that @p path names an existing directory
     */
    static bool validateWorkingDirectory(const QString &path, QString *errorMessage = nullptr);

    /**
     * Delay between typing text and pressing Enter in sendText()
     */
    static constexpr int EnterKeyDelayMs = 50;

Q_SIGNALS:
    void statusChanged(Conductor::ProcessStatus status);
    void processExited(int exitCode);

protected:
    /**
     * @param bufferCapacity capacity of the terminal buffer, 0 for none
     */
    explicit SessionBackend(int bufferCapacity, QObject *parent = nullptr);

    void setStatus(ProcessStatus status);
    void setProcessId(qint64 pid);

    /**
     * Move to @p finalStatus and emit processExited(). Only the first call
     * has an effect.
     */
    void reportExit(int exitCode, ProcessStatus finalStatus = ProcessStatus::Exited);

    static void setError(QString *errorMessage, const QString &message);

private:
    std::unique_ptr<TerminalBuffer> m_buffer;
    mutable QMutex m_mutex;
    ProcessStatus m_status = ProcessStatus::Starting;
    qint64 m_processId = 0;
    int m_exitCode = 0;
    bool m_exitReported = false;
};

} // namespace Conductor

#endif // SESSIONBACKEND_H
