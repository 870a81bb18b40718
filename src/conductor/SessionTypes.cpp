/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionTypes.h"

#include <QMetaEnum>

namespace Conductor
{

namespace
{

template<typename Enum>
QString enumName(Enum value)
{
    return QString::fromLatin1(QMetaEnum::fromType<Enum>().valueToKey(static_cast<int>(value)));
}

template<typename Enum>
Enum enumFromName(const QString &name, bool *ok)
{
    const QMetaEnum meta = QMetaEnum::fromType<Enum>();
    bool found = false;
    const int value = meta.keyToValue(name.toLatin1().constData(), &found);
    if (ok) {
        *ok = found;
    }
    return found ? static_cast<Enum>(value) : static_cast<Enum>(meta.value(0));
}

} // namespace

QString toString(ActivityState state)
{
    return enumName(state);
}

QString toString(ProcessStatus status)
{
    return enumName(status);
}

QString toString(BackendKind kind)
{
    return enumName(kind);
}

QString toString(VerificationStatus status)
{
    return enumName(status);
}

ActivityState activityStateFromString(const QString &name, bool *ok)
{
    return enumFromName<ActivityState>(name, ok);
}

BackendKind backendKindFromString(const QString &name, bool *ok)
{
    return enumFromName<BackendKind>(name, ok);
}

VerificationStatus verificationStatusFromString(const QString &name, bool *ok)
{
    return enumFromName<VerificationStatus>(name, ok);
}

} // namespace Conductor

#include "moc_SessionTypes.cpp"
