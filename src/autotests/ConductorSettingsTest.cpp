/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ConductorSettingsTest.h"

// Qt
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Conductor
#include "../conductor/ConductorSettings.h"
#include "../conductor/HookServer.h"
#include "../conductor/SessionStore.h"
#include "../conductor/TranscriptReader.h"

using namespace Conductor;

void ConductorSettingsTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_dir.isValid());
}

QString ConductorSettingsTest::configPath(const QString &name) const
{
    return m_dir.filePath(name);
}

void ConductorSettingsTest::testDefaults()
{
    ConductorSettings settings(configPath(QStringLiteral("defaults-rc")));

    QCOMPARE(settings.claudePath(), QStringLiteral("claude"));
    QVERIFY(settings.defaultClaudeArgs().isEmpty());
    QCOMPARE(settings.bufferSizeBytes(), TerminalBuffer::DefaultCapacity);
    QCOMPARE(settings.gracefulShutdownTimeoutSeconds(), 5);
    QCOMPARE(settings.terminalColumns(), 120);
    QCOMPARE(settings.terminalRows(), 30);

    QCOMPARE(settings.socketPath(), HookServer::defaultSocketPath());
    QCOMPARE(settings.clientReadTimeoutMs(), HookServer::DefaultClientTimeoutMs);
    QCOMPARE(settings.stateFilePath(), SessionStore::defaultFilePath());
    QCOMPARE(settings.claudeProjectsRoot(), TranscriptReader::defaultProjectsRoot());
}

void ConductorSettingsTest::testGeneralSettings()
{
    ConductorSettings settings(configPath(QStringLiteral("general-rc")));

    settings.setClaudePath(QStringLiteral("/opt/agent/bin/claude"));
    settings.setDefaultClaudeArgs({QStringLiteral("--verbose"), QStringLiteral("--model"), QStringLiteral("fast")});
    settings.setBufferSizeBytes(4096);
    settings.setGracefulShutdownTimeoutSeconds(9);
    settings.setTerminalColumns(200);
    settings.setTerminalRows(50);

    QCOMPARE(settings.claudePath(), QStringLiteral("/opt/agent/bin/claude"));
    QCOMPARE(settings.defaultClaudeArgs(), (QStringList{QStringLiteral("--verbose"), QStringLiteral("--model"), QStringLiteral("fast")}));
    QCOMPARE(settings.bufferSizeBytes(), 4096);
    QCOMPARE(settings.gracefulShutdownTimeoutSeconds(), 9);
    QCOMPARE(settings.terminalColumns(), 200);
    QCOMPARE(settings.terminalRows(), 50);

    // An empty path means the default again
    settings.setClaudePath(QString());
    QCOMPARE(settings.claudePath(), QStringLiteral("claude"));
}

void ConductorSettingsTest::testHookAndStorageSettings()
{
    ConductorSettings settings(configPath(QStringLiteral("storage-rc")));

    settings.setSocketPath(m_dir.filePath(QStringLiteral("hooks.sock")));
    settings.setClientReadTimeoutMs(750);
    settings.setStateFilePath(m_dir.filePath(QStringLiteral("state.json")));
    settings.setClaudeProjectsRoot(m_dir.filePath(QStringLiteral("projects")));

    QCOMPARE(settings.socketPath(), m_dir.filePath(QStringLiteral("hooks.sock")));
    QCOMPARE(settings.clientReadTimeoutMs(), 750);
    QCOMPARE(settings.stateFilePath(), m_dir.filePath(QStringLiteral("state.json")));
    QCOMPARE(settings.claudeProjectsRoot(), m_dir.filePath(QStringLiteral("projects")));

    settings.setSocketPath(QString());
    QCOMPARE(settings.socketPath(), HookServer::defaultSocketPath());
}

void ConductorSettingsTest::testNonPositiveValuesFallBack()
{
    ConductorSettings settings(configPath(QStringLiteral("invalid-rc")));

    settings.setBufferSizeBytes(0);
    settings.setGracefulShutdownTimeoutSeconds(-3);
    settings.setTerminalColumns(-1);
    settings.setTerminalRows(0);
    settings.setClientReadTimeoutMs(-100);

    QCOMPARE(settings.bufferSizeBytes(), TerminalBuffer::DefaultCapacity);
    QCOMPARE(settings.gracefulShutdownTimeoutSeconds(), 5);
    QCOMPARE(settings.terminalColumns(), 120);
    QCOMPARE(settings.terminalRows(), 30);
    QCOMPARE(settings.clientReadTimeoutMs(), HookServer::DefaultClientTimeoutMs);
}

void ConductorSettingsTest::testSettingsChangedSignal()
{
    ConductorSettings settings(configPath(QStringLiteral("signal-rc")));
    QSignalSpy spy(&settings, &ConductorSettings::settingsChanged);

    settings.setClaudePath(QStringLiteral("/usr/local/bin/claude"));
    settings.setTerminalRows(40);
    settings.setSocketPath(QStringLiteral("/tmp/x.sock"));

    QCOMPARE(spy.count(), 3);
}

void ConductorSettingsTest::testAgentOptions()
{
    ConductorSettings settings(configPath(QStringLiteral("agent-rc")));
    settings.setClaudePath(QStringLiteral("/usr/bin/claude"));
    settings.setDefaultClaudeArgs({QStringLiteral("--verbose")});
    settings.setBufferSizeBytes(8192);
    settings.setGracefulShutdownTimeoutSeconds(3);
    settings.setTerminalColumns(100);
    settings.setTerminalRows(40);

    const AgentOptions options = settings.agentOptions();
    QCOMPARE(options.claudePath, QStringLiteral("/usr/bin/claude"));
    QCOMPARE(options.defaultClaudeArgs, QStringList{QStringLiteral("--verbose")});
    QCOMPARE(options.bufferSizeBytes, 8192);
    QCOMPARE(options.gracefulShutdownTimeoutSeconds, 3);
    QCOMPARE(options.gracefulShutdownTimeoutMs(), 3000);
    QCOMPARE(options.terminalColumns, 100);
    QCOMPARE(options.terminalRows, 40);
}

void ConductorSettingsTest::testPersistence()
{
    const QString path = configPath(QStringLiteral("persist-rc"));
    {
        ConductorSettings settings(path);
        settings.setClaudePath(QStringLiteral("/srv/claude"));
        settings.setTerminalColumns(132);
        settings.setStateFilePath(QStringLiteral("/srv/state.json"));
        settings.save();
    }
    QVERIFY(QFile::exists(path));

    ConductorSettings reloaded(path);
    QCOMPARE(reloaded.claudePath(), QStringLiteral("/srv/claude"));
    QCOMPARE(reloaded.terminalColumns(), 132);
    QCOMPARE(reloaded.stateFilePath(), QStringLiteral("/srv/state.json"));
}

void ConductorSettingsTest::testInstance()
{
    QVERIFY(!ConductorSettings::instance());
    {
        ConductorSettings first(configPath(QStringLiteral("first-rc")));
        ConductorSettings second(configPath(QStringLiteral("second-rc")));
        QCOMPARE(ConductorSettings::instance(), &first);
    }
    QVERIFY(!ConductorSettings::instance());
}

QTEST_GUILESS_MAIN(ConductorSettingsTest)

#include "moc_ConductorSettingsTest.cpp"
