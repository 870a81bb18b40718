/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTOPTIONS_H
#define AGENTOPTIONS_H

#include "TerminalBuffer.h"

#include <QString>
#include <QStringList>

namespace Conductor
{

/**
 * Launch defaults for new sessions, usually taken from ConductorSettings
 */
struct AgentOptions {
    QString claudePath = QStringLiteral("claude");
    QStringList defaultClaudeArgs;
    int bufferSizeBytes = TerminalBuffer::DefaultCapacity;
    int gracefulShutdownTimeoutSeconds = 5;
    int terminalColumns = 120;
    int terminalRows = 30;

    int gracefulShutdownTimeoutMs() const
    {
        return gracefulShutdownTimeoutSeconds * 1000;
    }
};

} // namespace Conductor

#endif // AGENTOPTIONS_H
