/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptReader.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace Conductor
{

namespace
{

QString promptFromRecord(const QJsonObject &record)
{
    const QJsonValue message = record.value(QStringLiteral("message"));
    if (message.isString()) {
        return message.toString();
    }

    const QJsonValue content = message.toObject().value(QStringLiteral("content"));
    if (content.isString()) {
        return content.toString();
    }

    const QJsonArray parts = content.toArray();
    for (const QJsonValue &part : parts) {
        const QJsonObject obj = part.toObject();
        if (obj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
            return obj.value(QStringLiteral("text")).toString();
        }
    }
    return QString();
}

} // namespace

TranscriptReader::TranscriptReader(const QString &projectsRoot)
    : m_projectsRoot(projectsRoot.isEmpty() ? defaultProjectsRoot() : projectsRoot)
{
}

QString TranscriptReader::defaultProjectsRoot()
{
    return QDir::homePath() + QStringLiteral("/.claude/projects");
}

QString TranscriptReader::projectFolderName(const QString &workingDirectory)
{
    QString name = QDir::cleanPath(QDir(workingDirectory).absolutePath());
    name.replace(QLatin1Char(':'), QLatin1Char('-'));
    name.replace(QLatin1Char('\\'), QLatin1Char('-'));
    name.replace(QLatin1Char('/'), QLatin1Char('-'));
    name.replace(QLatin1Char('_'), QLatin1Char('-'));
    return name;
}

QString TranscriptReader::projectFolderPath(const QString &workingDirectory) const
{
    return m_projectsRoot + QLatin1Char('/') + projectFolderName(workingDirectory);
}

QString TranscriptReader::transcriptPath(const QString &externalSessionId, const QString &workingDirectory) const
{
    return projectFolderPath(workingDirectory) + QLatin1Char('/') + externalSessionId + QStringLiteral(".jsonl");
}

bool TranscriptReader::transcriptExists(const QString &externalSessionId, const QString &workingDirectory) const
{
    if (externalSessionId.isEmpty()) {
        return false;
    }
    return QFile::exists(transcriptPath(externalSessionId, workingDirectory));
}

QList<QFileInfo> TranscriptReader::transcriptFiles(const QString &workingDirectory) const
{
    QDir dir(projectFolderPath(workingDirectory));
    if (!dir.exists()) {
        return {};
    }
    return dir.entryInfoList({QStringLiteral("*.jsonl")}, QDir::Files, QDir::Time);
}

QList<TranscriptIndexEntry> TranscriptReader::readIndex(const QString &workingDirectory) const
{
    QList<TranscriptIndexEntry> entries;

    QFile file(projectFolderPath(workingDirectory) + QStringLiteral("/sessions-index.json"));
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return entries;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "TranscriptReader: Unreadable index" << file.fileName() << error.errorString();
        return entries;
    }

    const QJsonArray array = doc.object().value(QStringLiteral("entries")).toArray();
    for (const QJsonValue &value : array) {
        const QJsonObject obj = value.toObject();
        TranscriptIndexEntry entry;
        entry.sessionId = obj.value(QStringLiteral("sessionId")).toString();
        if (entry.sessionId.isEmpty()) {
            continue;
        }
        entry.summary = obj.value(QStringLiteral("summary")).toString();
        entry.firstPrompt = obj.value(QStringLiteral("firstPrompt")).toString();
        entry.gitBranch = obj.value(QStringLiteral("gitBranch")).toString();
        entry.fullPath = obj.value(QStringLiteral("fullPath")).toString();
        entry.messageCount = obj.value(QStringLiteral("messageCount")).toInt();
        entry.created = QDateTime::fromString(obj.value(QStringLiteral("created")).toString(), Qt::ISODateWithMs);
        entry.modified = QDateTime::fromString(obj.value(QStringLiteral("modified")).toString(), Qt::ISODateWithMs);
        entry.isSidechain = obj.value(QStringLiteral("isSidechain")).toBool();
        entries.append(entry);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const TranscriptIndexEntry &a, const TranscriptIndexEntry &b) {
        return a.modified > b.modified;
    });
    return entries;
}

bool TranscriptReader::isSystemInjectedContent(const QString &content)
{
    static const QStringList markers = {
        QStringLiteral("<command-message>"),
        QStringLiteral("<command-name>"),
        QStringLiteral("Base directory for this skill:"),
        QStringLiteral("<local-command-stdout>"),
        QStringLiteral("<task-notification>"),
        QStringLiteral("<system-reminder>"),
        QStringLiteral("<tool-result>"),
        QStringLiteral("This session is being continued from a previous conversation"),
    };

    for (const QString &marker : markers) {
        if (content.startsWith(marker)) {
            return true;
        }
    }
    return false;
}

QStringList TranscriptReader::extractUserPrompts(const QString &transcriptPath)
{
    QStringList prompts;

    QFile file(transcriptPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return prompts;
    }

    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }

        // The agent may be mid-write on the last line
        const QJsonDocument doc = QJsonDocument::fromJson(line);
        if (!doc.isObject()) {
            continue;
        }

        const QJsonObject record = doc.object();
        if (record.value(QStringLiteral("type")).toString() != QLatin1String("user")) {
            continue;
        }
        if (record.value(QStringLiteral("isMeta")).toBool()) {
            continue;
        }

        const QString content = promptFromRecord(record).trimmed();
        if (content.length() <= MinPromptLength || isSystemInjectedContent(content)) {
            continue;
        }
        prompts.append(content);
    }

    return prompts;
}

QString TranscriptReader::readFirstPrompt(const QString &transcriptPath)
{
    const QStringList prompts = extractUserPrompts(transcriptPath);
    if (prompts.isEmpty()) {
        return QString();
    }
    return normalizeWhitespace(prompts.first()).left(FirstPromptLength);
}

QString TranscriptReader::normalizeWhitespace(const QString &text)
{
    return text.simplified();
}

} // namespace Conductor
