/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTREADER_H
#define TRANSCRIPTREADER_H

#include "conductor_export.h"

#include <QDateTime>
#include <QFileInfo>
#include <QList>
#include <QString>
#include <QStringList>

namespace Conductor
{

/**
 * An agent conversation entry from sessions-index.json
 */
struct CONDUCTOR_EXPORT TranscriptIndexEntry {
    QString sessionId;
    QString summary;
    QString firstPrompt;
    QString gitBranch;
    QString fullPath;
    int messageCount = 0;
    QDateTime created;
    QDateTime modified;
    bool isSidechain = false;
};

/**
 * TranscriptReader reads the agent's own conversation records.
 *
 * The agent keeps one append-only JSONL file per conversation under
 * ~/.claude/projects/{mangled-project-path}/, plus a sessions-index.json.
 * These files are only ever read here.
 */
class CONDUCTOR_EXPORT TranscriptReader
{
public:
    /**
     * @param projectsRoot directory holding the per-project folders,
     *        defaults to defaultProjectsRoot()
     */
    explicit TranscriptReader(const QString &projectsRoot = QString());

    static QString defaultProjectsRoot();

    QString projectsRoot() const { return m_projectsRoot; }

    /**
     * Folder name the agent uses for @p workingDirectory:
     * ':', '\\', '/' and '_' all become '-'
     */
    static QString projectFolderName(const QString &workingDirectory);

    QString projectFolderPath(const QString &workingDirectory) const;
    QString transcriptPath(const QString &externalSessionId, const QString &workingDirectory) const;
    bool transcriptExists(const QString &externalSessionId, const QString &workingDirectory) const;

    /**
     * All transcripts for @p workingDirectory, most recently modified first
     */
    QList<QFileInfo> transcriptFiles(const QString &workingDirectory) const;

    /**
     * Entries of sessions-index.json, most recently modified first
     */
    QList<TranscriptIndexEntry> readIndex(const QString &workingDirectory) const;

    /**
     * Prompts the operator typed, in order. Injected content (command
     * expansions, skill boilerplate, tool output, compaction summaries) and
     * prompts of 10 characters or less are left out.
     */
    static QStringList extractUserPrompts(const QString &transcriptPath);

    /**
     * First operator prompt, cut to 100 characters
     */
    static QString readFirstPrompt(const QString &transcriptPath);

    static bool isSystemInjectedContent(const QString &content);

    /**
     * Collapse every whitespace run to one space and trim
     */
    static QString normalizeWhitespace(const QString &text);

    static constexpr int MinPromptLength = 10;
    static constexpr int FirstPromptLength = 100;

private:
    QString m_projectsRoot;
};

} // namespace Conductor

#endif // TRANSCRIPTREADER_H
