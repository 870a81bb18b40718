/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGERTEST_H
#define SESSIONMANAGERTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Conductor
{

class SessionManager;
class StubBackend;

class SessionManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // Creation
    void testCreateSession();
    void testCreateRejectsInvalidDirectory();
    void testCreateFailedStart();
    void testLaunchArguments();
    void testResumeBindsExternalId();

    // External id index
    void testRegisterFirstWriterWins();
    void testRegisterSameIdIsNoop();
    void testRegisterKeepsVerifiedLink();
    void testRelinkAndClear();
    void testApplyVerifiedLink();
    void testApplyVerifiedLinkRespectsMatchedHolder();

    // Removal and shutdown
    void testRemoveSession();
    void testRemoveUnknownSession();
    void testKillSession();
    void testKillAllSessions();

    // Session operations
    void testSendQueuedPrompt();

    // Ordering
    void testReorderSessions();

    // Persistence
    void testSaveState();
    void testLoadStateDeduplicatesExternalIds();
    void testRestoreState();
    void testRestoreMissingState();
    void testRestoreCorruptState();
    void testRebuildExternalIndex();
    void testRestoreSkipsHeldExternalId();
    void testScanForOrphans();

private:
    SessionManager *m_manager = nullptr;
    QList<StubBackend *> m_backends;
    bool m_failNextStart = false;
    QTemporaryDir m_dir;
};

}

#endif // SESSIONMANAGERTEST_H
