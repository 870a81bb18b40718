/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EXTERNALBACKEND_H
#define EXTERNALBACKEND_H

#include "SessionBackend.h"

#include <QTimer>

namespace Conductor
{

/**
 * ExternalBackend stands in for an agent process the core does not own,
 * typically a console window embedded by the presentation layer.
 *
 * Input and resizing are handed to callbacks installed by whoever owns the
 * window; without them they are no-ops. Liveness of the process is polled
 * with kill(pid, 0).
 */
class CONDUCTOR_EXPORT ExternalBackend : public SessionBackend
{
    Q_OBJECT

public:
    using InputHandler = std::function<void(const QByteArray &)>;
    using ResizeHandler = std::function<void(int columns, int rows)>;

    /**
     * @param processId pid of the external process, 0 if not known yet
     * @param windowHandle opaque handle of the window hosting it
     * @param bufferCapacity 0 when the owner keeps the terminal contents
     */
    explicit ExternalBackend(qint64 processId = 0, qint64 windowHandle = 0, int bufferCapacity = 0, QObject *parent = nullptr);
    ~ExternalBackend() override;

    BackendKind kind() const override { return BackendKind::ExternallyOwned; }

    bool start(const LaunchSpec &spec, QString *errorMessage = nullptr) override;
    void write(const QByteArray &data) override;
    void resize(int columns, int rows) override;
    void gracefulShutdown(int timeoutMs) override;

    qint64 windowHandle() const { return m_windowHandle; }
    void setWindowHandle(qint64 handle) { m_windowHandle = handle; }

    /**
     * Bind the process once the owner knows its pid
     */
    void attachProcess(qint64 processId);

    void setInputHandler(InputHandler handler) { m_inputHandler = std::move(handler); }
    void setResizeHandler(ResizeHandler handler) { m_resizeHandler = std::move(handler); }

    /**
     * Whether a process with @p pid exists
     */
    static bool processExists(qint64 pid);

    static constexpr int LivenessPollIntervalMs = 1000;

private Q_SLOTS:
    void checkAlive();

private:
    qint64 m_windowHandle = 0;
    bool m_started = false;
    InputHandler m_inputHandler;
    ResizeHandler m_resizeHandler;
    QTimer m_livenessTimer;
    QTimer m_killTimer;
};

} // namespace Conductor

#endif // EXTERNALBACKEND_H
