/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>

namespace Conductor
{

SessionStore::SessionStore(const QString &filePath)
    : m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString SessionStore::defaultFilePath()
{
    QString dataHome = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataHome + QStringLiteral("/conductor/sessions.json");
}

SessionStore::LoadResult SessionStore::loadResult() const
{
    LoadResult result;

    auto fail = [&result](const QString &message) {
        result.success = false;
        result.fileExistedButFailed = true;
        result.errorMessage = message;
        return result;
    };

    QFile file(m_filePath);
    if (!file.exists()) {
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SessionStore: Cannot read" << m_filePath << file.errorString();
        return fail(QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()));
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "SessionStore: Ignoring corrupt state file" << m_filePath << error.errorString();
        return fail(QStringLiteral("Corrupt state file %1: %2").arg(m_filePath, error.errorString()));
    }
    if (!doc.isObject()) {
        qWarning() << "SessionStore: State file is not a JSON object, ignoring" << m_filePath;
        return fail(QStringLiteral("State file %1 is not a JSON object").arg(m_filePath));
    }

    const QJsonObject root = doc.object();
    const int version = root.value(QStringLiteral("version")).toInt(FormatVersion);
    if (version > FormatVersion) {
        qWarning() << "SessionStore: State file version" << version << "is newer than" << FormatVersion;
    }

    const QJsonArray sessions = root.value(QStringLiteral("sessions")).toArray();
    for (const QJsonValue &value : sessions) {
        if (!value.isObject()) {
            continue;
        }
        QString error;
        PersistedSession state = PersistedSession::fromJson(value.toObject(), &error);
        if (state.isValid()) {
            result.sessions.append(state);
        } else if (!error.isEmpty()) {
            qWarning() << "SessionStore: Skipping session record," << error;
        } else {
            qWarning() << "SessionStore: Skipping invalid session record";
        }
    }

    qDebug() << "SessionStore: Loaded" << result.sessions.size() << "session(s) from" << m_filePath;
    return result;
}

QList<PersistedSession> SessionStore::load() const
{
    return loadResult().sessions;
}

bool SessionStore::save(const QList<PersistedSession> &sessions) const
{
    QFileInfo fileInfo(m_filePath);
    QDir().mkpath(fileInfo.absolutePath());

    QJsonArray array;
    for (const PersistedSession &state : sessions) {
        array.append(state.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("version")] = FormatVersion;
    root[QStringLiteral("sessions")] = array;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "SessionStore: Cannot write" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "SessionStore: Failed to commit" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

bool SessionStore::backup() const
{
    if (!QFile::exists(m_filePath)) {
        return false;
    }
    const QString backupPath = backupFilePath();
    QFile::remove(backupPath);
    if (!QFile::copy(m_filePath, backupPath)) {
        qWarning() << "SessionStore: Backup to" << backupPath << "failed";
        return false;
    }
    return true;
}

QString SessionStore::backupFilePath() const
{
    return m_filePath + QStringLiteral(".bak");
}

bool SessionStore::clear() const
{
    if (!QFile::exists(m_filePath)) {
        return true;
    }
    return QFile::remove(m_filePath);
}

} // namespace Conductor
