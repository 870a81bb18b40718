/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StatelessBackend.h"

#include <QDebug>

namespace Conductor
{

StatelessBackend::StatelessBackend(int bufferCapacity, QObject *parent)
    : SessionBackend(bufferCapacity, parent)
{
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_current) {
            qWarning() << "StatelessBackend: Exchange ignored terminate, killing";
            m_current->kill();
        }
    });
}

StatelessBackend::~StatelessBackend()
{
    if (m_current) {
        m_current->disconnect(this);
        m_current->kill();
        m_current->waitForFinished(1000);
    }
}

bool StatelessBackend::start(const LaunchSpec &spec, QString *errorMessage)
{
    if (m_started) {
        setError(errorMessage, QStringLiteral("Backend already started"));
        return false;
    }
    if (spec.executable.isEmpty()) {
        setError(errorMessage, QStringLiteral("Executable path required"));
        return false;
    }
    if (!validateWorkingDirectory(spec.workingDirectory, errorMessage)) {
        return false;
    }

    m_spec = spec;
    m_started = true;
    setStatus(ProcessStatus::Running);
    qDebug() << "StatelessBackend: Ready for" << spec.executable << "in" << spec.workingDirectory;
    return true;
}

void StatelessBackend::write(const QByteArray &data)
{
    Q_UNUSED(data)
    qDebug() << "StatelessBackend: Ignoring raw write, use sendText()";
}

QStringList StatelessBackend::exchangeArguments() const
{
    QStringList args = m_spec.arguments;
    if (!m_resumeSessionId.isEmpty()) {
        args << QStringLiteral("--resume") << m_resumeSessionId;
    }
    return args;
}

void StatelessBackend::sendText(const QString &text, std::function<void(bool)> done)
{
    if (!isRunning() || m_shuttingDown) {
        if (done) {
            done(false);
        }
        return;
    }
    if (m_current) {
        qDebug() << "StatelessBackend: Busy, ignoring prompt";
        if (done) {
            done(false);
        }
        return;
    }

    if (buffer()) {
        buffer()->write(QStringLiteral("> %1\n\n").arg(text).toUtf8());
    }

    m_current = new QProcess(this);
    m_current->setProgram(m_spec.executable);
    m_current->setArguments(exchangeArguments());
    m_current->setWorkingDirectory(m_spec.workingDirectory);
    m_current->setProcessChannelMode(QProcess::SeparateChannels);

    connect(m_current, &QProcess::readyReadStandardOutput, this, &StatelessBackend::onReadyReadStandardOutput);
    connect(m_current, &QProcess::finished, this, &StatelessBackend::onExchangeFinished);
    connect(m_current, &QProcess::errorOccurred, this, &StatelessBackend::onExchangeError);
    connect(m_current, &QProcess::started, this, &StatelessBackend::onExchangeStarted);

    m_pendingDone = std::move(done);
    m_pendingText = text.toUtf8();

    qDebug() << "StatelessBackend: Starting" << m_spec.executable << m_current->arguments();
    // Completion is reported from started() or errorOccurred()
    m_current->start();
}

void StatelessBackend::onExchangeStarted()
{
    if (!m_current) {
        return;
    }

    setProcessId(m_current->processId());
    Q_EMIT exchangeStarted(m_current->processId());

    m_current->write(m_pendingText);
    m_current->closeWriteChannel();
    m_pendingText.clear();

    completePending(true);
}

void StatelessBackend::completePending(bool ok)
{
    if (m_pendingDone) {
        auto callback = std::move(m_pendingDone);
        m_pendingDone = nullptr;
        callback(ok);
    }
}

void StatelessBackend::onReadyReadStandardOutput()
{
    if (m_current && buffer()) {
        buffer()->write(m_current->readAllStandardOutput());
    }
}

void StatelessBackend::onExchangeFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (!m_current) {
        return;
    }

    onReadyReadStandardOutput();
    const QByteArray errors = m_current->readAllStandardError();
    if (!errors.trimmed().isEmpty()) {
        qDebug() << "StatelessBackend: stderr:" << errors.trimmed();
    }
    if (buffer()) {
        buffer()->write(QByteArrayLiteral("\n"));
    }

    const int code = exitStatus == QProcess::CrashExit ? -1 : exitCode;
    qDebug() << "StatelessBackend: Exchange finished with code" << code;

    m_current->deleteLater();
    m_current = nullptr;
    m_pendingText.clear();
    m_killTimer.stop();

    completePending(false);
    Q_EMIT exchangeFinished(code);

    if (m_shuttingDown) {
        finishShutdown();
    }
}

void StatelessBackend::onExchangeError(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || !m_current) {
        return;
    }

    const QString reason = m_current->errorString();
    qWarning() << "StatelessBackend: Failed to start" << m_spec.executable << reason;
    if (buffer()) {
        buffer()->write(QStringLiteral("\n[Error: %1]\n").arg(reason).toUtf8());
    }

    m_current->deleteLater();
    m_current = nullptr;
    m_pendingText.clear();

    completePending(false);
    Q_EMIT exchangeFinished(-1);

    if (m_shuttingDown) {
        finishShutdown();
    }
}

void StatelessBackend::interrupt()
{
    if (m_current) {
        qDebug() << "StatelessBackend: Cancelling exchange";
        m_current->kill();
    }
}

void StatelessBackend::resize(int columns, int rows)
{
    Q_UNUSED(columns)
    Q_UNUSED(rows)
}

void StatelessBackend::gracefulShutdown(int timeoutMs)
{
    if (hasExited() || m_shuttingDown) {
        return;
    }

    m_shuttingDown = true;
    setStatus(ProcessStatus::Exiting);

    if (!m_current) {
        finishShutdown();
        return;
    }

    qDebug() << "StatelessBackend: Cancelling in-flight exchange for shutdown";
    m_current->terminate();
    m_killTimer.start(qMax(0, timeoutMs));
}

void StatelessBackend::finishShutdown()
{
    m_killTimer.stop();
    reportExit(0);
}

} // namespace Conductor

#include "moc_StatelessBackend.cpp"
