/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookServer.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTimer>

namespace Conductor
{

HookServer::HookServer(const QString &socketPath, QObject *parent)
    : QObject(parent)
    , m_socketPath(socketPath.isEmpty() ? defaultSocketPath() : socketPath)
{
}

HookServer::~HookServer()
{
    stop();
}

QString HookServer::defaultSocketPath()
{
    QString dataHome = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataHome + QStringLiteral("/conductor/conductor.sock");
}

QString HookServer::hookRelayPath()
{
    QString installed = QStandardPaths::findExecutable(QStringLiteral("conductor-hook-relay"));
    if (!installed.isEmpty()) {
        return installed;
    }

    QString relative = QCoreApplication::applicationDirPath() + QStringLiteral("/conductor-hook-relay");
    if (QFile::exists(relative)) {
        return relative;
    }

    return QString();
}

bool HookServer::start()
{
    if (m_server && m_server->isListening()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_socketPath).absolutePath());

    // A previous instance that crashed leaves its socket file behind
    if (QFile::exists(m_socketPath)) {
        QLocalServer::removeServer(m_socketPath);
        qDebug() << "HookServer: Removed stale socket" << m_socketPath;
    }

    m_server = new QLocalServer(this);
    m_server->setSocketOptions(QLocalServer::UserAccessOption);

    connect(m_server, &QLocalServer::newConnection, this, &HookServer::onNewConnection);

    if (!m_server->listen(m_socketPath)) {
        qWarning() << "HookServer: Failed to listen on" << m_socketPath << m_server->errorString();
        Q_EMIT errorOccurred(QStringLiteral("Failed to start hook server: ") + m_server->errorString());
        delete m_server;
        m_server = nullptr;
        return false;
    }

    qDebug() << "HookServer: Listening on" << m_socketPath;
    return true;
}

void HookServer::stop()
{
    if (m_server) {
        m_server->close();
        delete m_server;
        m_server = nullptr;
    }

    for (QLocalSocket *client : std::as_const(m_clients)) {
        client->disconnect(this);
        client->abort();
        client->deleteLater();
    }
    m_clients.clear();

    if (QFile::exists(m_socketPath)) {
        QFile::remove(m_socketPath);
    }
}

bool HookServer::isRunning() const
{
    return m_server && m_server->isListening();
}

void HookServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QLocalSocket *client = m_server->nextPendingConnection();
        if (!client) {
            continue;
        }
        m_clients.insert(client);

        connect(client, &QLocalSocket::readyRead, this, &HookServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &HookServer::onClientDisconnected);

        auto *timeout = new QTimer(client);
        timeout->setSingleShot(true);
        connect(timeout, &QTimer::timeout, this, [this, client]() {
            qWarning() << "HookServer: Client sent no complete message within" << m_clientTimeoutMs << "ms, dropping";
            dropClient(client);
        });
        timeout->start(m_clientTimeoutMs);

        Q_EMIT clientConnected();

        // Data may have arrived before the readyRead connection was made
        if (client->bytesAvailable() > 0) {
            QMetaObject::invokeMethod(client, [this, client]() {
                if (m_clients.contains(client) && client->canReadLine()) {
                    handleLine(client, client->readLine());
                }
            }, Qt::QueuedConnection);
        }
    }
}

void HookServer::onClientReadyRead()
{
    auto *client = qobject_cast<QLocalSocket *>(sender());
    if (!client || !m_clients.contains(client)) {
        return;
    }

    if (client->canReadLine()) {
        handleLine(client, client->readLine());
        return;
    }

    if (client->bytesAvailable() > MaxMessageBytes) {
        qWarning() << "HookServer: Message exceeds" << MaxMessageBytes << "bytes, dropping client";
        Q_EMIT errorOccurred(QStringLiteral("Hook message too large"));
        dropClient(client);
    }
}

void HookServer::onClientDisconnected()
{
    auto *client = qobject_cast<QLocalSocket *>(sender());
    if (!client || !m_clients.contains(client)) {
        return;
    }

    // A writer may close without a trailing newline
    const QByteArray rest = client->readAll().trimmed();
    if (!rest.isEmpty()) {
        handleLine(client, rest);
        return;
    }
    dropClient(client);
}

void HookServer::handleLine(QLocalSocket *client, const QByteArray &line)
{
    // One envelope per connection
    dropClient(client);

    HookEvent event;
    QString error;
    if (!parseMessage(line, &event, &error)) {
        qWarning() << "HookServer:" << error;
        Q_EMIT errorOccurred(error);
        return;
    }

    qDebug() << "HookServer: Received" << event.eventName << "for" << event.externalSessionId;
    Q_EMIT eventReceived(event);
}

void HookServer::dropClient(QLocalSocket *client)
{
    if (!m_clients.remove(client)) {
        return;
    }
    client->disconnect(this);
    if (client->state() != QLocalSocket::UnconnectedState) {
        client->disconnectFromServer();
    }
    client->deleteLater();
}

bool HookServer::parseMessage(const QByteArray &line, HookEvent *event, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &error);
    if (error.error != QJsonParseError::NoError) {
        return fail(QStringLiteral("Failed to parse hook message: ") + error.errorString());
    }
    if (!doc.isObject()) {
        return fail(QStringLiteral("Hook message is not a JSON object"));
    }

    QJsonObject payload = doc.object();
    if (payload.contains(QStringLiteral("event_type"))) {
        const QString eventType = payload.value(QStringLiteral("event_type")).toString();
        payload = payload.value(QStringLiteral("data")).toObject();
        if (!payload.contains(QStringLiteral("hook_event_name"))) {
            payload[QStringLiteral("hook_event_name")] = eventType;
        }
    }

    if (payload.value(QStringLiteral("hook_event_name")).toString().isEmpty()) {
        return fail(QStringLiteral("Hook message missing hook_event_name"));
    }

    if (event) {
        *event = HookEvent::fromJson(payload);
    }
    return true;
}

QJsonObject HookServer::generateHooksConfig(const QString &relayPath) const
{
    const QString relay = relayPath.isEmpty() ? hookRelayPath() : relayPath;
    if (relay.isEmpty()) {
        return QJsonObject();
    }

    QJsonObject hooks;
    for (HookEvent::Kind kind : HookEvent::knownKinds()) {
        const QString name = HookEvent::nameOf(kind);
        const QString command = QStringLiteral("\"%1\" --socket \"%2\" --event %3").arg(relay, m_socketPath, name);

        QJsonObject hook;
        hook[QStringLiteral("type")] = QStringLiteral("command");
        hook[QStringLiteral("command")] = command;
        hook[QStringLiteral("async")] = true;

        QJsonObject entry;
        entry[QStringLiteral("matcher")] = QStringLiteral("*");
        entry[QStringLiteral("hooks")] = QJsonArray{hook};

        hooks[name] = QJsonArray{entry};
    }

    QJsonObject root;
    root[QStringLiteral("hooks")] = hooks;
    return root;
}

} // namespace Conductor

#include "moc_HookServer.cpp"
