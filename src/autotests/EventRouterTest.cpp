/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "EventRouterTest.h"

// Qt
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Conductor
#include "../conductor/EventRouter.h"
#include "../conductor/HookServer.h"
#include "../conductor/SessionManager.h"
#include "StubBackend.h"

using namespace Conductor;

namespace
{

HookEvent makeEvent(HookEvent::Kind kind, const QString &sessionId)
{
    HookEvent event;
    event.kind = kind;
    event.eventName = HookEvent::nameOf(kind);
    event.externalSessionId = sessionId;
    return event;
}

} // namespace

void EventRouterTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QVERIFY(m_dir.isValid());
}

void EventRouterTest::init()
{
    m_manager = new SessionManager();
    m_manager->setBackendFactory(BackendKind::Pty, [](const SessionOptions &, const AgentOptions &) -> SessionBackend * {
        return new StubBackend(BackendKind::Pty, QCoreApplication::applicationPid());
    });
}

void EventRouterTest::cleanup()
{
    delete m_manager;
    m_manager = nullptr;
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
    QCoreApplication::processEvents();
}

Session *EventRouterTest::createSession(const QString &externalId)
{
    SessionOptions options;
    options.workingDirectory = m_dir.path();
    Session *session = m_manager->createSession(options);
    if (session && !externalId.isEmpty()) {
        m_manager->registerExternalId(session->id(), externalId);
    }
    return session;
}

void EventRouterTest::testRoutesToOwningSession()
{
    Session *session = createSession(QStringLiteral("owner"));
    QVERIFY(session);

    EventRouter router(m_manager);
    QSignalSpy routedSpy(&router, &EventRouter::eventRouted);

    QVERIFY(router.route(makeEvent(HookEvent::Kind::UserPromptSubmit, QStringLiteral("owner"))));
    QCOMPARE(session->activityState(), ActivityState::Working);
    QCOMPARE(routedSpy.count(), 1);
    QCOMPARE(routedSpy.first().first().value<Session *>(), session);

    QVERIFY(router.route(makeEvent(HookEvent::Kind::Stop, QStringLiteral("owner"))));
    QCOMPARE(session->activityState(), ActivityState::WaitingForInput);
}

void EventRouterTest::testUnknownIdIsDropped()
{
    Session *session = createSession(QStringLiteral("known"));
    QVERIFY(session);

    EventRouter router(m_manager);
    QSignalSpy unroutedSpy(&router, &EventRouter::unroutedEvent);
    QSignalSpy createdSpy(m_manager, &SessionManager::sessionCreated);

    QVERIFY(!router.route(makeEvent(HookEvent::Kind::UserPromptSubmit, QStringLiteral("stranger"))));

    QCOMPARE(unroutedSpy.count(), 1);
    QCOMPARE(createdSpy.count(), 0);
    QCOMPARE(m_manager->count(), 1);
    QVERIFY(!m_manager->sessionByExternalId(QStringLiteral("stranger")));
    QCOMPARE(session->activityState(), ActivityState::Starting);
}

void EventRouterTest::testMissingIdIsDropped()
{
    Session *unbound = createSession(QString());
    QVERIFY(unbound);

    EventRouter router(m_manager);
    QSignalSpy unroutedSpy(&router, &EventRouter::unroutedEvent);

    QVERIFY(!router.route(makeEvent(HookEvent::Kind::SessionStart, QString())));
    QCOMPARE(unroutedSpy.count(), 1);
    QCOMPARE(unbound->activityState(), ActivityState::Starting);
}

void EventRouterTest::testEventsOnlyReachTheirSession()
{
    Session *a = createSession(QStringLiteral("a"));
    Session *b = createSession(QStringLiteral("b"));

    EventRouter router(m_manager);
    router.route(makeEvent(HookEvent::Kind::SessionStart, QStringLiteral("a")));
    router.route(makeEvent(HookEvent::Kind::PermissionRequest, QStringLiteral("b")));

    QCOMPARE(a->activityState(), ActivityState::Idle);
    QCOMPARE(b->activityState(), ActivityState::WaitingForPermission);
}

void EventRouterTest::testLifecycleSequence()
{
    Session *session = createSession(QStringLiteral("lifecycle"));
    QVERIFY(session);

    EventRouter router(m_manager);
    QSignalSpy changedSpy(session, &Session::activityStateChanged);

    const QList<HookEvent::Kind> events = {
        HookEvent::Kind::SessionStart,
        HookEvent::Kind::UserPromptSubmit,
        HookEvent::Kind::Stop,
        HookEvent::Kind::SubagentStop,
        HookEvent::Kind::UserPromptSubmit,
        HookEvent::Kind::PermissionRequest,
        HookEvent::Kind::Stop,
        HookEvent::Kind::SessionEnd,
    };
    const QList<ActivityState> expected = {
        ActivityState::Idle,
        ActivityState::Working,
        ActivityState::WaitingForInput,
        ActivityState::WaitingForInput,
        ActivityState::Working,
        ActivityState::WaitingForPermission,
        ActivityState::WaitingForInput,
        ActivityState::Exited,
    };

    QList<ActivityState> observed;
    for (HookEvent::Kind kind : events) {
        QVERIFY(router.route(makeEvent(kind, QStringLiteral("lifecycle"))));
        observed.append(session->activityState());
    }
    QCOMPARE(observed, expected);

    // The late SubagentStop changed nothing
    QCOMPARE(changedSpy.count(), 7);

    // Exited absorbs everything after it
    router.route(makeEvent(HookEvent::Kind::UserPromptSubmit, QStringLiteral("lifecycle")));
    QCOMPARE(session->activityState(), ActivityState::Exited);
}

void EventRouterTest::testEndToEndThroughServer()
{
    Session *session = createSession(QStringLiteral("wire"));
    QVERIFY(session);

    HookServer server(m_dir.filePath(QStringLiteral("router.sock")));
    QVERIFY(server.start());

    EventRouter router(m_manager);
    router.attach(&server);
    QSignalSpy routedSpy(&router, &EventRouter::eventRouted);

    QJsonObject data;
    data[QStringLiteral("session_id")] = QStringLiteral("wire");
    data[QStringLiteral("tool_name")] = QStringLiteral("Bash");
    QJsonObject envelope;
    envelope[QStringLiteral("event_type")] = QStringLiteral("PreToolUse");
    envelope[QStringLiteral("data")] = data;

    QLocalSocket socket;
    socket.connectToServer(server.socketPath());
    QVERIFY(socket.waitForConnected(2000));
    socket.write(QJsonDocument(envelope).toJson(QJsonDocument::Compact) + "\n");
    QVERIFY(socket.waitForBytesWritten(2000));

    QVERIFY(routedSpy.wait(3000));
    QCOMPARE(session->activityState(), ActivityState::Working);
    QCOMPARE(routedSpy.first().at(1).value<HookEvent>().toolName, QStringLiteral("Bash"));

    server.stop();
}

QTEST_GUILESS_MAIN(EventRouterTest)

#include "moc_EventRouterTest.cpp"
