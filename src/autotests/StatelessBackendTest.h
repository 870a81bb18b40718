/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATELESSBACKENDTEST_H
#define STATELESSBACKENDTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Conductor
{

class StatelessBackendTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanup();

    void testStartValidation();
    void testExchange();
    void testBusyRejectsPrompt();
    void testResumeArguments();
    void testInterruptCancelsExchange();
    void testFailedToStart();
    void testShutdownWhenIdle();
    void testShutdownDuringExchange();

private:
    QTemporaryDir m_dir;
};

}

#endif // STATELESSBACKENDTEST_H
