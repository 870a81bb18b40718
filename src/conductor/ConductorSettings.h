/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONDUCTORSETTINGS_H
#define CONDUCTORSETTINGS_H

#include "conductor_export.h"

#include "AgentOptions.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Conductor
{

/**
 * ConductorSettings holds the orchestrator's configuration.
 *
 * Settings are stored in ~/.config/conductorrc and grouped as:
 * - General: agent executable, default arguments, buffer and terminal sizes
 * - Hooks: socket path and client read timeout
 * - Storage: state file and transcript locations
 *
 * Out-of-range numbers read back as their defaults.
 */
class CONDUCTOR_EXPORT ConductorSettings : public QObject
{
    Q_OBJECT

public:
    static ConductorSettings *instance();

    /**
     * @param configName config file name or absolute path
     */
    explicit ConductorSettings(const QString &configName = QStringLiteral("conductorrc"), QObject *parent = nullptr);
    ~ConductorSettings() override;

    // ========== General ==========

    QString claudePath() const;
    void setClaudePath(const QString &path);

    QStringList defaultClaudeArgs() const;
    void setDefaultClaudeArgs(const QStringList &args);

    /**
     * Terminal buffer capacity per session
     */
    int bufferSizeBytes() const;
    void setBufferSizeBytes(int bytes);

    int gracefulShutdownTimeoutSeconds() const;
    void setGracefulShutdownTimeoutSeconds(int seconds);

    int terminalColumns() const;
    void setTerminalColumns(int columns);

    int terminalRows() const;
    void setTerminalRows(int rows);

    // ========== Hooks ==========

    /**
     * Local socket the hook relay writes to
     */
    QString socketPath() const;
    void setSocketPath(const QString &path);

    int clientReadTimeoutMs() const;
    void setClientReadTimeoutMs(int ms);

    // ========== Storage ==========

    QString stateFilePath() const;
    void setStateFilePath(const QString &path);

    /**
     * Root of the agent's per-project transcript folders
     */
    QString claudeProjectsRoot() const;
    void setClaudeProjectsRoot(const QString &path);

    /**
     * Launch defaults for SessionManager
     */
    AgentOptions agentOptions() const;

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static ConductorSettings *s_instance;
    KSharedConfig::Ptr m_config;
};

} // namespace Conductor

#endif // CONDUCTORSETTINGS_H
