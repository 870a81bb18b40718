/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "StatelessBackendTest.h"

// Qt
#include <QCoreApplication>
#include <QSignalSpy>
#include <QTest>

// Conductor
#include "../conductor/StatelessBackend.h"

using namespace Conductor;

namespace
{

LaunchSpec makeSpec(const QString &workingDirectory, const QString &executable, const QStringList &arguments = {})
{
    LaunchSpec spec;
    spec.executable = executable;
    spec.arguments = arguments;
    spec.workingDirectory = workingDirectory;
    return spec;
}

} // namespace

void StatelessBackendTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
}

void StatelessBackendTest::cleanup()
{
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    QCoreApplication::processEvents();
}

void StatelessBackendTest::testStartValidation()
{
    QString error;

    StatelessBackend noProgram(4096);
    QVERIFY(!noProgram.start(makeSpec(m_dir.path(), QString()), &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    StatelessBackend badDir(4096);
    QVERIFY(!badDir.start(makeSpec(m_dir.filePath(QStringLiteral("missing")), QStringLiteral("/bin/cat")), &error));
    QVERIFY(!error.isEmpty());

    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/cat"))));
    QCOMPARE(backend.kind(), BackendKind::Stateless);
    QCOMPARE(backend.status(), ProcessStatus::Running);
    QVERIFY(!backend.isBusy());

    // Raw keystrokes have nowhere to go
    backend.write(QByteArrayLiteral("ignored"));
    QVERIFY(backend.buffer()->dumpAll().isEmpty());
}

void StatelessBackendTest::testExchange()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/cat"))));

    QSignalSpy startedSpy(&backend, &StatelessBackend::exchangeStarted);
    QSignalSpy finishedSpy(&backend, &StatelessBackend::exchangeFinished);

    int callbacks = 0;
    bool accepted = false;
    backend.sendText(QStringLiteral("summarize the diff"), [&](bool ok) {
        ++callbacks;
        accepted = ok;
    });
    // The exchange is in flight as soon as sendText() returns
    QVERIFY(backend.isBusy());

    QTRY_VERIFY(accepted);
    QCOMPARE(startedSpy.count(), 1);
    QVERIFY(backend.processId() > 0);

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);
    QCOMPARE(finishedSpy.first().first().toInt(), 0);
    QVERIFY(!backend.isBusy());
    QCOMPARE(callbacks, 1);

    const QByteArray output = backend.buffer()->dumpAll();
    QVERIFY(output.startsWith("> summarize the diff\n\n"));
    QCOMPARE(output.count("summarize the diff"), 2);

    // The backend stays usable between exchanges
    QCOMPARE(backend.status(), ProcessStatus::Running);
}

void StatelessBackendTest::testBusyRejectsPrompt()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("sleep 0.5; cat")})));

    QSignalSpy finishedSpy(&backend, &StatelessBackend::exchangeFinished);

    backend.sendText(QStringLiteral("first prompt"));
    QVERIFY(backend.isBusy());

    bool second = true;
    backend.sendText(QStringLiteral("second prompt"), [&second](bool ok) {
        second = ok;
    });
    QVERIFY(!second);

    QVERIFY(finishedSpy.wait(5000));
    const QByteArray output = backend.buffer()->dumpAll();
    QVERIFY(output.contains("first prompt"));
    QVERIFY(!output.contains("second prompt"));
}

void StatelessBackendTest::testResumeArguments()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/echo"), {QStringLiteral("-p")})));

    QCOMPARE(backend.exchangeArguments(), QStringList{QStringLiteral("-p")});

    backend.setResumeSessionId(QStringLiteral("conv-42"));
    QCOMPARE(backend.exchangeArguments(), (QStringList{QStringLiteral("-p"), QStringLiteral("--resume"), QStringLiteral("conv-42")}));

    QSignalSpy finishedSpy(&backend, &StatelessBackend::exchangeFinished);
    backend.sendText(QStringLiteral("continue please"));
    QVERIFY(finishedSpy.wait(5000));
    QVERIFY(backend.buffer()->dumpAll().contains("-p --resume conv-42"));
}

void StatelessBackendTest::testInterruptCancelsExchange()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("sleep 30")})));

    QSignalSpy finishedSpy(&backend, &StatelessBackend::exchangeFinished);
    backend.sendText(QStringLiteral("long running"));
    QVERIFY(backend.isBusy());

    backend.interrupt();
    QVERIFY(finishedSpy.wait(5000));
    QCOMPARE(finishedSpy.first().first().toInt(), -1);
    QVERIFY(!backend.isBusy());
    QCOMPARE(backend.status(), ProcessStatus::Running);
}

void StatelessBackendTest::testFailedToStart()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), m_dir.filePath(QStringLiteral("no-such-agent")))));

    QSignalSpy finishedSpy(&backend, &StatelessBackend::exchangeFinished);
    bool accepted = true;
    int callbacks = 0;
    backend.sendText(QStringLiteral("hello"), [&](bool ok) {
        ++callbacks;
        accepted = ok;
    });

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);
    QVERIFY(!accepted);
    QCOMPARE(callbacks, 1);
    QCOMPARE(finishedSpy.first().first().toInt(), -1);
    QVERIFY(!backend.isBusy());
    QVERIFY(backend.buffer()->dumpAll().contains("[Error:"));
    QCOMPARE(backend.status(), ProcessStatus::Running);
}

void StatelessBackendTest::testShutdownWhenIdle()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/cat"))));

    QSignalSpy exitedSpy(&backend, &SessionBackend::processExited);
    backend.gracefulShutdown(1000);
    backend.gracefulShutdown(1000);

    QCOMPARE(exitedSpy.count(), 1);
    QCOMPARE(backend.status(), ProcessStatus::Exited);

    bool accepted = true;
    backend.sendText(QStringLiteral("too late"), [&accepted](bool ok) {
        accepted = ok;
    });
    QVERIFY(!accepted);
}

void StatelessBackendTest::testShutdownDuringExchange()
{
    StatelessBackend backend(4096);
    QVERIFY(backend.start(makeSpec(m_dir.path(), QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("sleep 30")})));
    backend.sendText(QStringLiteral("busy work"));

    QSignalSpy exitedSpy(&backend, &SessionBackend::processExited);
    backend.gracefulShutdown(500);
    QCOMPARE(backend.status(), ProcessStatus::Exiting);

    QVERIFY(exitedSpy.wait(5000));
    QCOMPARE(exitedSpy.count(), 1);
    QCOMPARE(backend.status(), ProcessStatus::Exited);
}

QTEST_GUILESS_MAIN(StatelessBackendTest)

#include "moc_StatelessBackendTest.cpp"
