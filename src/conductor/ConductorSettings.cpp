/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConductorSettings.h"

#include "HookServer.h"
#include "SessionStore.h"
#include "TranscriptReader.h"

#include <KConfigGroup>
#include <QDebug>

namespace Conductor
{

namespace
{

int positiveOr(int value, int fallback)
{
    return value > 0 ? value : fallback;
}

} // namespace

ConductorSettings *ConductorSettings::s_instance = nullptr;

ConductorSettings *ConductorSettings::instance()
{
    return s_instance;
}

ConductorSettings::ConductorSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // ~/.config/conductorrc unless a path is given
    m_config = KSharedConfig::openConfig(configName, KConfig::SimpleConfig);
}

ConductorSettings::~ConductorSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

QString ConductorSettings::claudePath() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    const QString path = group.readEntry("ClaudePath", QStringLiteral("claude"));
    return path.isEmpty() ? QStringLiteral("claude") : path;
}

void ConductorSettings::setClaudePath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("ClaudePath", path);
    Q_EMIT settingsChanged();
}

QStringList ConductorSettings::defaultClaudeArgs() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return group.readEntry("DefaultClaudeArgs", QStringList());
}

void ConductorSettings::setDefaultClaudeArgs(const QStringList &args)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("DefaultClaudeArgs", args);
    Q_EMIT settingsChanged();
}

int ConductorSettings::bufferSizeBytes() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return positiveOr(group.readEntry("BufferSizeBytes", TerminalBuffer::DefaultCapacity), TerminalBuffer::DefaultCapacity);
}

void ConductorSettings::setBufferSizeBytes(int bytes)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("BufferSizeBytes", bytes);
    Q_EMIT settingsChanged();
}

int ConductorSettings::gracefulShutdownTimeoutSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return positiveOr(group.readEntry("GracefulShutdownTimeoutSeconds", 5), 5);
}

void ConductorSettings::setGracefulShutdownTimeoutSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("GracefulShutdownTimeoutSeconds", seconds);
    Q_EMIT settingsChanged();
}

int ConductorSettings::terminalColumns() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return positiveOr(group.readEntry("TerminalColumns", 120), 120);
}

void ConductorSettings::setTerminalColumns(int columns)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("TerminalColumns", columns);
    Q_EMIT settingsChanged();
}

int ConductorSettings::terminalRows() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return positiveOr(group.readEntry("TerminalRows", 30), 30);
}

void ConductorSettings::setTerminalRows(int rows)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("TerminalRows", rows);
    Q_EMIT settingsChanged();
}

QString ConductorSettings::socketPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    const QString path = group.readEntry("SocketPath", QString());
    return path.isEmpty() ? HookServer::defaultSocketPath() : path;
}

void ConductorSettings::setSocketPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    group.writeEntry("SocketPath", path);
    Q_EMIT settingsChanged();
}

int ConductorSettings::clientReadTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    return positiveOr(group.readEntry("ClientReadTimeoutMs", HookServer::DefaultClientTimeoutMs), HookServer::DefaultClientTimeoutMs);
}

void ConductorSettings::setClientReadTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Hooks"));
    group.writeEntry("ClientReadTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

QString ConductorSettings::stateFilePath() const
{
    KConfigGroup group(m_config, QStringLiteral("Storage"));
    const QString path = group.readEntry("StateFilePath", QString());
    return path.isEmpty() ? SessionStore::defaultFilePath() : path;
}

void ConductorSettings::setStateFilePath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Storage"));
    group.writeEntry("StateFilePath", path);
    Q_EMIT settingsChanged();
}

QString ConductorSettings::claudeProjectsRoot() const
{
    KConfigGroup group(m_config, QStringLiteral("Storage"));
    const QString path = group.readEntry("ClaudeProjectsRoot", QString());
    return path.isEmpty() ? TranscriptReader::defaultProjectsRoot() : path;
}

void ConductorSettings::setClaudeProjectsRoot(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Storage"));
    group.writeEntry("ClaudeProjectsRoot", path);
    Q_EMIT settingsChanged();
}

AgentOptions ConductorSettings::agentOptions() const
{
    AgentOptions options;
    options.claudePath = claudePath();
    options.defaultClaudeArgs = defaultClaudeArgs();
    options.bufferSizeBytes = bufferSizeBytes();
    options.gracefulShutdownTimeoutSeconds = gracefulShutdownTimeoutSeconds();
    options.terminalColumns = terminalColumns();
    options.terminalRows = terminalRows();
    return options;
}

void ConductorSettings::save()
{
    if (!m_config->sync()) {
        qWarning() << "ConductorSettings: Failed to write" << m_config->name();
    }
}

} // namespace Conductor

#include "moc_ConductorSettings.cpp"
