/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionVerifier.h"

#include "Session.h"
#include "SessionManager.h"
#include "TerminalBuffer.h"

#include <QDebug>
#include <QDir>
#include <QRegularExpression>

namespace Conductor
{

namespace
{

class VerificationGuard
{
public:
    explicit VerificationGuard(Session *session)
        : m_session(session)
    {
    }
    ~VerificationGuard()
    {
        m_session->endVerification();
    }

private:
    Session *m_session;
};

} // namespace

SessionVerifier::SessionVerifier(SessionManager *manager, const TranscriptReader &reader, QObject *parent)
    : QObject(parent)
    , m_manager(manager)
    , m_reader(reader)
{
}

SessionVerifier::~SessionVerifier() = default;

QString SessionVerifier::stripAnsi(const QString &text)
{
    // CSI sequences, OSC strings, then two-byte escapes
    static const QRegularExpression ansi(QStringLiteral("\\x1B\\[[0-?]*[ -/]*[@-~]"
                                                        "|\\x1B\\][^\\x07\\x1B]*(?:\\x07|\\x1B\\\\)"
                                                        "|\\x1B[@-Z\\\\-_]"));
    QString result = text;
    result.remove(ansi);
    result.remove(QLatin1Char('\r'));
    return result;
}

int SessionVerifier::countContentLines(const QString &text)
{
    int count = 0;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        if (!line.trimmed().isEmpty()) {
            ++count;
        }
    }
    return count;
}

double SessionVerifier::matchRatio(const QStringList &prompts, const QString &normalizedText)
{
    if (prompts.isEmpty()) {
        return 0.0;
    }

    int matched = 0;
    int cursor = 0;
    for (const QString &prompt : prompts) {
        const QString needle = TranscriptReader::normalizeWhitespace(prompt);
        const int at = normalizedText.indexOf(needle, cursor);
        if (at >= 0) {
            ++matched;
            cursor = at + needle.length();
        }
    }
    return static_cast<double>(matched) / prompts.size();
}

VerificationStatus SessionVerifier::verify(Session *session)
{
    if (!session) {
        return VerificationStatus::Waiting;
    }

    QString text;
    if (TerminalBuffer *buffer = session->buffer()) {
        text = QString::fromUtf8(buffer->dumpAll());
    }
    return verify(session, text);
}

VerificationStatus SessionVerifier::verify(Session *session, const QString &terminalText)
{
    if (!session) {
        return VerificationStatus::Waiting;
    }

    if (session->isVerificationSettled() || session->verificationStatus() == VerificationStatus::Matched) {
        return session->verificationStatus();
    }

    if (!session->tryBeginVerification()) {
        qDebug() << "SessionVerifier: Verification already running for" << session->id();
        return session->verificationStatus();
    }
    VerificationGuard guard(session);

    const QString sample = stripAnsi(terminalText);
    const int lineCount = countContentLines(sample);
    const bool confirmationRun = lineCount >= ConfirmationLineCount;
    const VerificationStatus unchanged = session->verificationStatus();

    qDebug() << "SessionVerifier: Verifying" << session->id() << "lines:" << lineCount << "confirmation:" << confirmationRun;

    QDir projectDir(m_reader.projectFolderPath(session->workingDirectory()));
    if (!projectDir.exists()) {
        qDebug() << "SessionVerifier: No transcript folder" << projectDir.path();
        return finish(session, confirmationRun ? VerificationStatus::Failed : unchanged);
    }

    const QList<QFileInfo> files = m_reader.transcriptFiles(session->workingDirectory());
    if (files.isEmpty()) {
        qDebug() << "SessionVerifier: No transcripts in" << projectDir.path();
        return finish(session, confirmationRun ? VerificationStatus::Failed : unchanged);
    }

    // Transcripts started around the session's creation come first
    QList<QFileInfo> ordered;
    QList<QFileInfo> rest;
    const QDateTime createdAt = session->createdAt();
    for (const QFileInfo &file : files) {
        if (createdAt.isValid() && qAbs(file.lastModified().secsTo(createdAt)) < CandidateWindowSecs) {
            ordered.append(file);
        } else {
            rest.append(file);
        }
    }
    ordered.append(rest);

    const QString normalized = TranscriptReader::normalizeWhitespace(sample);
    const QList<Candidate> matches = findMatches(ordered, normalized);

    if (matches.isEmpty()) {
        return finish(session, confirmationRun ? VerificationStatus::Failed : unchanged);
    }

    if (matches.size() > 1) {
        qWarning() << "SessionVerifier:" << matches.size() << "transcripts match session" << session->id() << "- using" << matches.first().externalSessionId;
    }

    if (!confirmationRun) {
        session->setPotentialExternalId(matches.first().externalSessionId);
        return finish(session, VerificationStatus::Potential);
    }

    if (!m_manager) {
        qWarning() << "SessionVerifier: No session manager to link" << session->id();
        return finish(session, VerificationStatus::Failed);
    }

    for (const Candidate &candidate : matches) {
        const QString firstPrompt = TranscriptReader::readFirstPrompt(candidate.path);
        if (m_manager->applyVerifiedLink(session->id(), candidate.externalSessionId, firstPrompt)) {
            if (!firstPrompt.isEmpty()) {
                session->setExpectedFirstPrompt(firstPrompt);
            }
            Q_EMIT verificationFinished(session, VerificationStatus::Matched);
            return VerificationStatus::Matched;
        }
    }

    return finish(session, VerificationStatus::Failed);
}

QList<SessionVerifier::Candidate> SessionVerifier::findMatches(const QList<QFileInfo> &files, const QString &normalizedText) const
{
    QList<Candidate> matches;
    for (const QFileInfo &file : files) {
        const QStringList prompts = TranscriptReader::extractUserPrompts(file.absoluteFilePath());
        if (prompts.isEmpty()) {
            continue;
        }

        const double ratio = matchRatio(prompts, normalizedText);
        qDebug() << "SessionVerifier:" << file.fileName() << "prompts:" << prompts.size() << "ratio:" << ratio;
        if (ratio < MatchThreshold) {
            continue;
        }
        matches.append({file.completeBaseName(), file.absoluteFilePath()});
    }
    return matches;
}

VerificationStatus SessionVerifier::finish(Session *session, VerificationStatus status)
{
    if (status == VerificationStatus::Failed) {
        session->setVerificationSettled(true);
    }
    session->setVerificationStatus(status);
    Q_EMIT verificationFinished(session, status);
    return status;
}

void SessionVerifier::resetVerification(Session *session)
{
    if (!session || session->verificationStatus() == VerificationStatus::Matched) {
        return;
    }
    session->setVerificationSettled(false);
    session->setPotentialExternalId(QString());
    session->setVerificationStatus(VerificationStatus::Waiting);
}

SessionVerifier::LinkCheck SessionVerifier::checkLinkedTranscript(Session *session) const
{
    if (!session || session->externalSessionId().isEmpty()) {
        return LinkCheck::NotLinked;
    }

    const QString path = m_reader.transcriptPath(session->externalSessionId(), session->workingDirectory());
    if (!QFileInfo::exists(path)) {
        qDebug() << "SessionVerifier: Transcript missing for" << session->id() << path;
        return LinkCheck::TranscriptMissing;
    }

    const QString expected = TranscriptReader::normalizeWhitespace(session->expectedFirstPrompt()).left(TranscriptReader::FirstPromptLength);
    if (expected.isEmpty()) {
        return LinkCheck::Valid;
    }

    const QString actual = TranscriptReader::readFirstPrompt(path);
    if (!actual.isEmpty() && actual != expected) {
        qDebug() << "SessionVerifier: First prompt differs for" << session->id();
        return LinkCheck::FirstPromptMismatch;
    }
    return LinkCheck::Valid;
}

} // namespace Conductor

#include "moc_SessionVerifier.cpp"
