/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTREADERTEST_H
#define TRANSCRIPTREADERTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Conductor
{


class TranscriptReaderTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testProjectFolderName();
    void testProjectFolderPath();
    void testTranscriptFilesNewestFirst();
    void testMissingProjectFolder();
    void testIsSystemInjectedContent_data();
    void testIsSystemInjectedContent();
    void testExtractUserPrompts();
    void testExtractFromMissingFile();
    void testReadFirstPrompt();
    void testReadIndex();
    void testReadCorruptIndex();

private:
    QTemporaryDir m_root;
};

}

#endif // TRANSCRIPTREADERTEST_H
