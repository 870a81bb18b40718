/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONDUCTORSETTINGSTEST_H
#define CONDUCTORSETTINGSTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Conductor
{

class ConductorSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testDefaults();
    void testGeneralSettings();
    void testHookAndStorageSettings();
    void testNonPositiveValuesFallBack();
    void testSettingsChangedSignal();
    void testAgentOptions();
    void testPersistence();
    void testInstance();

private:
    QString configPath(const QString &name) const;

    QTemporaryDir m_dir;
};

}

#endif // CONDUCTORSETTINGSTEST_H
