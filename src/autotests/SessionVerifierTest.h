/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONVERIFIERTEST_H
#define SESSIONVERIFIERTEST_H

#include <QObject>
#include <QString>
#include <QTemporaryDir>

namespace Conductor
{

class Session;
class SessionManager;
class SessionVerifier;

class SessionVerifierTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    // Helpers
    void testStripAnsi();
    void testCountContentLines();
    void testMatchRatio();

    // Outcomes
    void testPotentialOnShortSample();
    void testMatchedOnConfirmationRun();
    void testFailedOnConfirmationRun();
    void testShortSampleWithoutMatchKeepsStatus();
    void testMissingProjectFolder();
    void testMatchIgnoresAnsiAndWrapping();
    void testVerifyReadsTerminalBuffer();
    void testRecentTranscriptPreferred();
    void testMatchTakesIdFromUnverifiedHolder();

    // Settled results
    void testFailedIsSettled();
    void testMatchedNeverRegresses();
    void testResetVerification();

    void testCheckLinkedTranscript();

private:
    Session *createSession();
    QString projectFolder() const;

    QTemporaryDir m_dir;
    QString m_workDir;
    QString m_projectsRoot;
    SessionManager *m_manager = nullptr;
    SessionVerifier *m_verifier = nullptr;
};

}

#endif // SESSIONVERIFIERTEST_H
