/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include "conductor_export.h"

#include "PersistedSession.h"

#include <QList>
#include <QString>

namespace Conductor
{

/**
 * SessionStore reads and writes the session state file:
 *
 *   { "version": 1, "sessions": [ {...}, ... ] }
 *
 * Saving replaces the whole file atomically. Loading never throws: a missing
 * file means no sessions, and an unreadable or corrupt file is logged and
 * also read as no sessions, with LoadResult telling the two apart.
 */
class CONDUCTOR_EXPORT SessionStore
{
public:
    static constexpr int FormatVersion = 1;

    struct LoadResult {
        bool success = true;
        /// The file was there but could not be read or parsed
        bool fileExistedButFailed = false;
        QString errorMessage;
        QList<PersistedSession> sessions;
    };

    /**
     * @param filePath state file, defaults to defaultFilePath()
     */
    explicit SessionStore(const QString &filePath = QString());

    QString filePath() const { return m_filePath; }

    /**
     * ~/.local/share/conductor/sessions.json
     */
    static QString defaultFilePath();

    LoadResult loadResult() const;

    /**
     * Sessions from loadResult(), empty on failure
     */
    QList<PersistedSession> load() const;
    bool save(const QList<PersistedSession> &sessions) const;

    /**
     * Copy the current file to backupFilePath()
     */
    bool backup() const;
    QString backupFilePath() const;

    /**
     * Delete the state file
     */
    bool clear() const;

private:
    QString m_filePath;
};

} // namespace Conductor

#endif // SESSIONSTORE_H
