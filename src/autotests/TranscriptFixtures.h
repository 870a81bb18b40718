/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTFIXTURES_H
#define TRANSCRIPTFIXTURES_H

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace Conductor
{
namespace TranscriptFixtures
{

inline QByteArray userRecord(const QString &text, bool isMeta = false)
{
    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("user");
    message[QStringLiteral("content")] = text;

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("user");
    record[QStringLiteral("message")] = message;
    if (isMeta) {
        record[QStringLiteral("isMeta")] = true;
    }
    return QJsonDocument(record).toJson(QJsonDocument::Compact);
}

inline QByteArray userBlocksRecord(const QString &text)
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("text");
    block[QStringLiteral("text")] = text;

    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("user");
    message[QStringLiteral("content")] = QJsonArray{block};

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("user");
    record[QStringLiteral("message")] = message;
    return QJsonDocument(record).toJson(QJsonDocument::Compact);
}

inline QByteArray assistantRecord(const QString &text)
{
    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("content")] = text;

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("assistant");
    record[QStringLiteral("message")] = message;
    return QJsonDocument(record).toJson(QJsonDocument::Compact);
}

/**
 * Write a transcript with one user record per prompt, each followed by an
 * assistant reply
 */
inline bool writeTranscript(const QString &folder, const QString &sessionId, const QStringList &prompts)
{
    QDir().mkpath(folder);
    QFile file(folder + QLatin1Char('/') + sessionId + QStringLiteral(".jsonl"));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    for (const QString &prompt : prompts) {
        file.write(userRecord(prompt) + '\n');
        file.write(assistantRecord(QStringLiteral("Done.")) + '\n');
    }
    return true;
}

}
}

#endif // TRANSCRIPTFIXTURES_H
