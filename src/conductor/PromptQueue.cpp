/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PromptQueue.h"

#include <QDebug>

namespace Conductor
{

QJsonObject PromptQueueItem::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id.toString(QUuid::WithoutBraces);
    obj[QStringLiteral("text")] = text;
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    return obj;
}

PromptQueueItem PromptQueueItem::fromJson(const QJsonObject &obj)
{
    PromptQueueItem item;
    item.id = QUuid::fromString(obj.value(QStringLiteral("id")).toString());
    item.text = obj.value(QStringLiteral("text")).toString();
    item.createdAt = QDateTime::fromString(obj.value(QStringLiteral("createdAt")).toString(), Qt::ISODate);
    return item;
}

PromptQueue::PromptQueue(QObject *parent)
    : QObject(parent)
{
}

PromptQueue::~PromptQueue() = default;

PromptQueueItem PromptQueue::enqueue(const QString &text)
{
    PromptQueueItem item;
    item.id = QUuid::createUuid();
    item.text = text;
    item.createdAt = QDateTime::currentDateTimeUtc();

    qDebug() << "PromptQueue: Enqueue" << text.left(60);
    m_items.append(item);
    Q_EMIT queueChanged();
    return item;
}

int PromptQueue::indexOf(const QUuid &id) const
{
    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

PromptQueueItem PromptQueue::findById(const QUuid &id) const
{
    const int index = indexOf(id);
    return index < 0 ? PromptQueueItem() : m_items.at(index);
}

bool PromptQueue::remove(const QUuid &id)
{
    return take(id).isValid();
}

PromptQueueItem PromptQueue::take(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return PromptQueueItem();
    }
    PromptQueueItem item = m_items.takeAt(index);
    Q_EMIT queueChanged();
    return item;
}

bool PromptQueue::insert(int index, const PromptQueueItem &item)
{
    if (!item.isValid() || indexOf(item.id) >= 0) {
        return false;
    }
    m_items.insert(qBound(0, index, int(m_items.size())), item);
    Q_EMIT queueChanged();
    return true;
}

bool PromptQueue::moveUp(const QUuid &id)
{
    const int index = indexOf(id);
    if (index <= 0) {
        return false;
    }
    m_items.swapItemsAt(index, index - 1);
    Q_EMIT queueChanged();
    return true;
}

bool PromptQueue::moveDown(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0 || index >= m_items.size() - 1) {
        return false;
    }
    m_items.swapItemsAt(index, index + 1);
    Q_EMIT queueChanged();
    return true;
}

bool PromptQueue::moveTo(const QUuid &id, int index)
{
    const int from = indexOf(id);
    if (from < 0) {
        return false;
    }
    const int to = qBound(0, index, m_items.size() - 1);
    if (from == to) {
        return false;
    }
    m_items.move(from, to);
    Q_EMIT queueChanged();
    return true;
}

void PromptQueue::clear()
{
    if (m_items.isEmpty()) {
        return;
    }
    qDebug() << "PromptQueue: Clearing" << m_items.size() << "item(s)";
    m_items.clear();
    Q_EMIT queueChanged();
}

void PromptQueue::loadFrom(const QList<PromptQueueItem> &items)
{
    m_items.clear();
    for (const PromptQueueItem &item : items) {
        if (item.isValid()) {
            m_items.append(item);
        }
    }
    Q_EMIT queueChanged();
}

} // namespace Conductor

#include "moc_PromptQueue.cpp"
