/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "HookServerTest.h"

// Qt
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QProcess>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Conductor
#include "../conductor/HookServer.h"

using namespace Conductor;

namespace
{

bool sendToServer(const QString &path, const QByteArray &data)
{
    QLocalSocket socket;
    socket.connectToServer(path);
    if (!socket.waitForConnected(2000)) {
        return false;
    }
    socket.write(data);
    if (!socket.waitForBytesWritten(2000)) {
        return false;
    }
    socket.disconnectFromServer();
    return true;
}

QByteArray hookLine(const QString &eventName, const QString &sessionId)
{
    QJsonObject payload;
    payload[QStringLiteral("hook_event_name")] = eventName;
    payload[QStringLiteral("session_id")] = sessionId;
    payload[QStringLiteral("cwd")] = QStringLiteral("/home/user/project");
    return QJsonDocument(payload).toJson(QJsonDocument::Compact) + "\n";
}

} // namespace

void HookServerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_dir.isValid());
}

void HookServerTest::cleanupTestCase()
{
}

void HookServerTest::cleanup()
{
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    QCoreApplication::processEvents();
}

QString HookServerTest::socketPath(const QString &name) const
{
    return m_dir.filePath(name + QStringLiteral(".sock"));
}

void HookServerTest::testDefaultSocketPath()
{
    const QString path = HookServer::defaultSocketPath();
    QVERIFY(path.contains(QStringLiteral("conductor")));
    QVERIFY(path.endsWith(QStringLiteral(".sock")));

    HookServer server;
    QCOMPARE(server.socketPath(), path);
    QCOMPARE(server.clientTimeout(), HookServer::DefaultClientTimeoutMs);
}

void HookServerTest::testStartStop()
{
    HookServer server(socketPath(QStringLiteral("startstop")));
    QVERIFY(!server.isRunning());

    QVERIFY(server.start());
    QVERIFY(server.isRunning());
    QVERIFY(QFile::exists(server.socketPath()));

    // Second start is a no-op
    QVERIFY(server.start());

    server.stop();
    QVERIFY(!server.isRunning());
    QVERIFY(!QFile::exists(server.socketPath()));
}

void HookServerTest::testStaleSocketReplaced()
{
    const QString path = socketPath(QStringLiteral("stale"));
    {
        QFile stale(path);
        QVERIFY(stale.open(QIODevice::WriteOnly));
        stale.write("left over");
    }

    HookServer server(path);
    QVERIFY(server.start());

    QSignalSpy spy(&server, &HookServer::eventReceived);
    QVERIFY(sendToServer(path, hookLine(QStringLiteral("Stop"), QStringLiteral("s1"))));
    QVERIFY(spy.wait(3000));
    server.stop();
}

void HookServerTest::testParseRawPayload()
{
    HookEvent event;
    QString error;
    QVERIFY(HookServer::parseMessage(hookLine(QStringLiteral("PreToolUse"), QStringLiteral("abc")), &event, &error));

    QCOMPARE(event.kind, HookEvent::Kind::PreToolUse);
    QCOMPARE(event.externalSessionId, QStringLiteral("abc"));
    QCOMPARE(event.workingDirectory, QStringLiteral("/home/user/project"));
    QVERIFY(event.receivedAt.isValid());
}

void HookServerTest::testParseEnvelope()
{
    QJsonObject data;
    data[QStringLiteral("session_id")] = QStringLiteral("env-1");
    data[QStringLiteral("notification_type")] = QStringLiteral("permission_prompt");

    QJsonObject envelope;
    envelope[QStringLiteral("event_type")] = QStringLiteral("Notification");
    envelope[QStringLiteral("data")] = data;

    HookEvent event;
    QVERIFY(HookServer::parseMessage(QJsonDocument(envelope).toJson(QJsonDocument::Compact), &event));
    QCOMPARE(event.kind, HookEvent::Kind::Notification);
    QCOMPARE(event.externalSessionId, QStringLiteral("env-1"));
    QVERIFY(event.isPermissionNotification());

    // Unknown kinds still parse; routing decides what to do with them
    envelope[QStringLiteral("event_type")] = QStringLiteral("BrandNewHook");
    QVERIFY(HookServer::parseMessage(QJsonDocument(envelope).toJson(QJsonDocument::Compact), &event));
    QCOMPARE(event.kind, HookEvent::Kind::Unknown);
    QCOMPARE(event.eventName, QStringLiteral("BrandNewHook"));
}

void HookServerTest::testParseRejectsBadInput()
{
    QString error;
    QVERIFY(!HookServer::parseMessage(QByteArrayLiteral("{not json"), nullptr, &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!HookServer::parseMessage(QByteArrayLiteral("[1,2]"), nullptr, &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!HookServer::parseMessage(QByteArrayLiteral("{\"session_id\":\"x\"}"), nullptr, &error));
    QVERIFY(error.contains(QStringLiteral("hook_event_name")));
}

void HookServerTest::testReceiveEvent()
{
    HookServer server(socketPath(QStringLiteral("receive")));
    QVERIFY(server.start());

    QSignalSpy connectedSpy(&server, &HookServer::clientConnected);
    QSignalSpy eventSpy(&server, &HookServer::eventReceived);

    QVERIFY(sendToServer(server.socketPath(), hookLine(QStringLiteral("UserPromptSubmit"), QStringLiteral("conv-9"))));
    QVERIFY(eventSpy.wait(3000));

    QCOMPARE(connectedSpy.count(), 1);
    QCOMPARE(eventSpy.count(), 1);
    const HookEvent event = eventSpy.first().first().value<HookEvent>();
    QCOMPARE(event.kind, HookEvent::Kind::UserPromptSubmit);
    QCOMPARE(event.externalSessionId, QStringLiteral("conv-9"));

    server.stop();
}

void HookServerTest::testMessageWithoutNewline()
{
    HookServer server(socketPath(QStringLiteral("nonewline")));
    QVERIFY(server.start());

    QSignalSpy eventSpy(&server, &HookServer::eventReceived);
    QByteArray line = hookLine(QStringLiteral("Stop"), QStringLiteral("conv-1"));
    line.chop(1);

    QVERIFY(sendToServer(server.socketPath(), line));
    QVERIFY(eventSpy.wait(3000));
    QCOMPARE(eventSpy.first().first().value<HookEvent>().kind, HookEvent::Kind::Stop);

    server.stop();
}

void HookServerTest::testMalformedThenValid()
{
    HookServer server(socketPath(QStringLiteral("malformed")));
    QVERIFY(server.start());

    QSignalSpy errorSpy(&server, &HookServer::errorOccurred);
    QSignalSpy eventSpy(&server, &HookServer::eventReceived);

    QVERIFY(sendToServer(server.socketPath(), QByteArrayLiteral("this is not json\n")));
    QVERIFY(errorSpy.wait(3000));
    QCOMPARE(eventSpy.count(), 0);

    // The server keeps accepting after a bad client
    QVERIFY(sendToServer(server.socketPath(), hookLine(QStringLiteral("SessionStart"), QStringLiteral("after-bad"))));
    QVERIFY(eventSpy.wait(3000));
    QCOMPARE(eventSpy.first().first().value<HookEvent>().externalSessionId, QStringLiteral("after-bad"));

    server.stop();
}

void HookServerTest::testManySequentialClients()
{
    HookServer server(socketPath(QStringLiteral("sequential")));
    QVERIFY(server.start());

    QSignalSpy eventSpy(&server, &HookServer::eventReceived);
    const int clients = 25;
    for (int i = 0; i < clients; ++i) {
        QVERIFY(sendToServer(server.socketPath(), hookLine(QStringLiteral("PostToolUse"), QStringLiteral("seq-%1").arg(i))));
        QTRY_COMPARE_WITH_TIMEOUT(eventSpy.count(), i + 1, 3000);
    }

    // Arrival order is kept
    for (int i = 0; i < clients; ++i) {
        QCOMPARE(eventSpy.at(i).first().value<HookEvent>().externalSessionId, QStringLiteral("seq-%1").arg(i));
    }

    server.stop();
}

void HookServerTest::testConcurrentClients()
{
    HookServer server(socketPath(QStringLiteral("concurrent")));
    QVERIFY(server.start());

    QSignalSpy eventSpy(&server, &HookServer::eventReceived);

    QList<QLocalSocket *> sockets;
    for (int i = 0; i < 10; ++i) {
        auto *socket = new QLocalSocket(this);
        socket->connectToServer(server.socketPath());
        QVERIFY(socket->waitForConnected(2000));
        sockets.append(socket);
    }
    for (int i = 0; i < sockets.size(); ++i) {
        sockets.at(i)->write(hookLine(QStringLiteral("Stop"), QStringLiteral("c-%1").arg(i)));
        sockets.at(i)->flush();
    }

    QTRY_COMPARE_WITH_TIMEOUT(eventSpy.count(), sockets.size(), 5000);
    qDeleteAll(sockets);

    server.stop();
}

void HookServerTest::testSilentClientDropped()
{
    HookServer server(socketPath(QStringLiteral("silent")));
    server.setClientTimeout(200);
    QVERIFY(server.start());

    QLocalSocket socket;
    socket.connectToServer(server.socketPath());
    QVERIFY(socket.waitForConnected(2000));

    // Partial message, never finished
    socket.write("{\"hook_event_name\":");
    socket.flush();

    QSignalSpy disconnectedSpy(&socket, &QLocalSocket::disconnected);
    QVERIFY(disconnectedSpy.wait(3000));

    // And the server still serves the next client
    QSignalSpy eventSpy(&server, &HookServer::eventReceived);
    QVERIFY(sendToServer(server.socketPath(), hookLine(QStringLiteral("Stop"), QStringLiteral("next"))));
    QVERIFY(eventSpy.wait(3000));

    server.stop();
}

void HookServerTest::testGenerateHooksConfig()
{
    HookServer server(socketPath(QStringLiteral("config")));
    const QJsonObject config = server.generateHooksConfig(QStringLiteral("/opt/conductor/conductor-hook-relay"));

    const QJsonObject hooks = config.value(QStringLiteral("hooks")).toObject();
    QCOMPARE(hooks.size(), HookEvent::knownKinds().size());

    const QJsonArray stop = hooks.value(QStringLiteral("Stop")).toArray();
    QCOMPARE(stop.size(), 1);
    const QJsonObject entry = stop.first().toObject();
    QCOMPARE(entry.value(QStringLiteral("matcher")).toString(), QStringLiteral("*"));

    const QJsonObject hook = entry.value(QStringLiteral("hooks")).toArray().first().toObject();
    QCOMPARE(hook.value(QStringLiteral("type")).toString(), QStringLiteral("command"));
    const QString command = hook.value(QStringLiteral("command")).toString();
    QVERIFY(command.contains(QStringLiteral("/opt/conductor/conductor-hook-relay")));
    QVERIFY(command.contains(server.socketPath()));
    QVERIFY(command.endsWith(QStringLiteral("--event Stop")));

    QVERIFY(hooks.contains(QStringLiteral("PermissionRequest")));
    QVERIFY(hooks.contains(QStringLiteral("SessionEnd")));
}

void HookServerTest::testRelayForwardsPayload()
{
    HookServer server(socketPath(QStringLiteral("relay")));
    QVERIFY(server.start());
    QSignalSpy eventSpy(&server, &HookServer::eventReceived);

    QProcess relay;
    relay.start(QStringLiteral(CONDUCTOR_HOOK_RELAY), {QStringLiteral("--socket"), server.socketPath(), QStringLiteral("--event"), QStringLiteral("Notification")});
    QVERIFY(relay.waitForStarted(3000));

    QJsonObject payload;
    payload[QStringLiteral("session_id")] = QStringLiteral("conv-relay");
    payload[QStringLiteral("notification_type")] = QStringLiteral("permission_prompt");
    payload[QStringLiteral("message")] = QStringLiteral("Claude needs your permission to use Bash");
    relay.write(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    relay.closeWriteChannel();

    QVERIFY(eventSpy.wait(5000));
    QVERIFY(relay.waitForFinished(5000));
    QCOMPARE(relay.exitStatus(), QProcess::NormalExit);
    QCOMPARE(relay.exitCode(), 0);

    const HookEvent event = eventSpy.first().first().value<HookEvent>();
    QCOMPARE(event.kind, HookEvent::Kind::Notification);
    QCOMPARE(event.externalSessionId, QStringLiteral("conv-relay"));
    QCOMPARE(event.notificationType, QStringLiteral("permission_prompt"));

    server.stop();
}

void HookServerTest::testRelayWithoutServer()
{
    QProcess relay;
    relay.start(QStringLiteral(CONDUCTOR_HOOK_RELAY), {QStringLiteral("--socket"), socketPath(QStringLiteral("nobody-home")), QStringLiteral("--timeout"), QStringLiteral("500")});
    QVERIFY(relay.waitForStarted(3000));
    relay.write(R"({"hook_event_name":"Stop","session_id":"conv-x"})");
    relay.closeWriteChannel();

    QVERIFY(relay.waitForFinished(5000));
    QCOMPARE(relay.exitCode(), 0);
}

QTEST_GUILESS_MAIN(HookServerTest)

#include "moc_HookServerTest.cpp"
