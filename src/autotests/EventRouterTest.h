/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTROUTERTEST_H
#define EVENTROUTERTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Conductor
{

class Session;
class SessionManager;

class EventRouterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testRoutesToOwningSession();
    void testUnknownIdIsDropped();
    void testMissingIdIsDropped();
    void testEventsOnlyReachTheirSession();
    void testLifecycleSequence();
    void testEndToEndThroughServer();

private:
    Session *createSession(const QString &externalId);

    SessionManager *m_manager = nullptr;
    QTemporaryDir m_dir;
};

}

#endif // EVENTROUTERTEST_H
