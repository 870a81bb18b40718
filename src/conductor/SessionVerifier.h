/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONVERIFIER_H
#define SESSIONVERIFIER_H

#include "conductor_export.h"

#include "SessionTypes.h"
#include "TranscriptReader.h"

#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

namespace Conductor
{

class Session;
class SessionManager;

/**
 * SessionVerifier works out which agent transcript a session belongs to.
 *
 * The operator prompts recorded in each candidate transcript are looked for,
 * in order, in the session's terminal output. A match on a sample of
 * ConfirmationLineCount lines or more binds the transcript's id to the
 * session through SessionManager::applyVerifiedLink(). A match on a smaller
 * sample is only reported as Potential.
 */
class CONDUCTOR_EXPORT SessionVerifier : public QObject
{
    Q_OBJECT

public:
    enum class LinkCheck {
        Valid,
        NotLinked,
        TranscriptMissing,
        FirstPromptMismatch,
    };
    Q_ENUM(LinkCheck)

    explicit SessionVerifier(SessionManager *manager, const TranscriptReader &reader = TranscriptReader(), QObject *parent = nullptr);
    ~SessionVerifier() override;

    const TranscriptReader &reader() const { return m_reader; }

    /**
     * Verify @p session against its own terminal buffer
     */
    VerificationStatus verify(Session *session);

    /**
     * Verify @p session against @p terminalText
     *
     * A settled result (Matched, or the outcome of an earlier confirmation
     * run) is returned unchanged. Concurrent calls for the same session
     * return the current status without scanning.
     */
    VerificationStatus verify(Session *session, const QString &terminalText);

    /**
     * Forget a settled result so the next verify() scans again.
     * A Matched link is kept.
     */
    void resetVerification(Session *session);

    /**
     * Check that the session's external id still points at a transcript
     * whose first prompt is the one we expect
     */
    LinkCheck checkLinkedTranscript(Session *session) const;

    static QString stripAnsi(const QString &text);
    static int countContentLines(const QString &text);

    /**
     * Fraction of @p prompts found one after another in @p normalizedText
     */
    static double matchRatio(const QStringList &prompts, const QString &normalizedText);

    static constexpr int ConfirmationLineCount = 50;
    static constexpr double MatchThreshold = 0.95;
    static constexpr qint64 CandidateWindowSecs = 3600;

Q_SIGNALS:
    void verificationFinished(Conductor::Session *session, Conductor::VerificationStatus status);

private:
    struct Candidate {
        QString externalSessionId;
        QString path;
    };

    QList<Candidate> findMatches(const QList<QFileInfo> &files, const QString &normalizedText) const;
    VerificationStatus finish(Session *session, VerificationStatus status);

    QPointer<SessionManager> m_manager;
    TranscriptReader m_reader;
};

} // namespace Conductor

#endif // SESSIONVERIFIER_H
