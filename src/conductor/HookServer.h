/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKSERVER_H
#define HOOKSERVER_H

#include "conductor_export.h"

#include "HookEvent.h"

#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>
#include <QString>

namespace Conductor
{

/**
 * HookServer receives hook events from the agent processes.
 *
 * It listens on a local socket (default
 * ~/.local/share/conductor/conductor.sock) that only the current user may
 * connect to. The agent's hooks call conductor-hook-relay, which connects,
 * writes one JSON line and disconnects.
 *
 * Two line formats are accepted:
 * - the raw hook payload: {"hook_event_name":"Stop","session_id":...}
 * - the relay envelope:   {"event_type":"Stop","data":{...}}
 *
 * A malformed line is reported through errorOccurred() and the connection
 * is dropped; the server keeps accepting. A client that does not deliver a
 * complete line within clientTimeout() is disconnected.
 */
class CONDUCTOR_EXPORT HookServer : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultClientTimeoutMs = 5000;
    static constexpr qint64 MaxMessageBytes = 1024 * 1024;

    /**
     * @param socketPath socket to listen on, defaults to defaultSocketPath()
     */
    explicit HookServer(const QString &socketPath = QString(), QObject *parent = nullptr);
    ~HookServer() override;

    static QString defaultSocketPath();

    /**
     * Locate the conductor-hook-relay binary
     */
    static QString hookRelayPath();

    QString socketPath() const { return m_socketPath; }

    int clientTimeout() const { return m_clientTimeoutMs; }
    void setClientTimeout(int ms) { m_clientTimeoutMs = ms; }

    /**
     * Start listening, replacing a stale socket file
     *
     * @return true if listening
     */
    bool start();
    void stop();
    bool isRunning() const;

    /**
     * Hooks configuration routing every event kind to @p relayPath,
     * in the agent's settings.json "hooks" format
     */
    QJsonObject generateHooksConfig(const QString &relayPath = QString()) const;

    /**
     * Decode one line. Returns false and sets @p errorMessage on malformed input.
     */
    static bool parseMessage(const QByteArray &line, HookEvent *event, QString *errorMessage = nullptr);

Q_SIGNALS:
    void eventReceived(const Conductor::HookEvent &event);
    void errorOccurred(const QString &error);
    void clientConnected();

private Q_SLOTS:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    void handleLine(QLocalSocket *client, const QByteArray &line);
    void dropClient(QLocalSocket *client);

    QString m_socketPath;
    QLocalServer *m_server = nullptr;
    QSet<QLocalSocket *> m_clients;
    int m_clientTimeoutMs = DefaultClientTimeoutMs;
};

} // namespace Conductor

#endif // HOOKSERVER_H
