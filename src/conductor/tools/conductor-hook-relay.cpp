/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later

    conductor-hook-relay - forwards agent hook events to Conductor

    The agent runs this for every configured hook. The hook payload is read
    from stdin (JSON) and sent as one line to the Conductor socket.

    Usage:
        conductor-hook-relay [--socket <path>] [--event <name>] [--timeout <ms>]

    The relay always exits 0 so a missing or stale socket never disturbs
    the agent.
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QStandardPaths>
#include <QTextStream>

namespace
{

QString defaultSocketPath()
{
    const QString fromEnv = qEnvironmentVariable("CONDUCTOR_SOCKET");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QStringLiteral("/conductor/conductor.sock");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("conductor-hook-relay"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Agent hook relay for Conductor"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption socketOption(QStringList() << QStringLiteral("s") << QStringLiteral("socket"),
                                    QStringLiteral("Path to the Conductor socket"),
                                    QStringLiteral("path"),
                                    defaultSocketPath());
    parser.addOption(socketOption);

    QCommandLineOption eventOption(QStringList() << QStringLiteral("e") << QStringLiteral("event"),
                                   QStringLiteral("Hook event name, if the payload does not carry one"),
                                   QStringLiteral("name"));
    parser.addOption(eventOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Connection timeout in milliseconds (default: 5000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("5000"));
    parser.addOption(timeoutOption);

    parser.process(app);

    const QString socketPath = parser.value(socketOption);
    bool timeoutOk = false;
    int timeout = parser.value(timeoutOption).toInt(&timeoutOk);
    if (!timeoutOk || timeout <= 0) {
        timeout = 5000;
    }

    QFile stdinFile;
    QByteArray stdinData;
    if (stdinFile.open(stdin, QIODevice::ReadOnly)) {
        stdinData = stdinFile.readAll();
        stdinFile.close();
    }

    QJsonObject eventData;
    if (!stdinData.trimmed().isEmpty()) {
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(stdinData, &error);
        if (error.error == QJsonParseError::NoError && doc.isObject()) {
            eventData = doc.object();
        } else {
            QTextStream err(stderr);
            err << "conductor-hook-relay: ignoring unreadable payload: " << error.errorString() << "\n";
        }
    }

    QString eventName = parser.value(eventOption);
    if (eventName.isEmpty()) {
        eventName = eventData.value(QStringLiteral("hook_event_name")).toString();
    }
    if (eventName.isEmpty()) {
        QTextStream err(stderr);
        err << "conductor-hook-relay: no event name given\n";
        return 0;
    }

    // Conductor is not running
    if (!QFileInfo::exists(socketPath)) {
        return 0;
    }

    QLocalSocket socket;
    socket.connectToServer(socketPath);
    if (!socket.waitForConnected(timeout)) {
        return 0;
    }

    QJsonObject msg;
    msg[QStringLiteral("event_type")] = eventName;
    msg[QStringLiteral("data")] = eventData;

    socket.write(QJsonDocument(msg).toJson(QJsonDocument::Compact) + "\n");
    if (!socket.waitForBytesWritten(timeout)) {
        return 0;
    }

    socket.disconnectFromServer();
    if (socket.state() != QLocalSocket::UnconnectedState) {
        socket.waitForDisconnected(timeout);
    }
    return 0;
}
