/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROMPTQUEUE_H
#define PROMPTQUEUE_H

#include "conductor_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>
#include <QUuid>

namespace Conductor
{

/**
 * A prompt waiting to be sent to a session
 */
struct CONDUCTOR_EXPORT PromptQueueItem {
    QUuid id;
    QString text;
    QDateTime createdAt;

    QJsonObject toJson() const;
    static PromptQueueItem fromJson(const QJsonObject &obj);

    bool isValid() const { return !id.isNull(); }
};

/**
 * PromptQueue holds the prompts queued for one session, in send order.
 * A prompt's position is its index in items().
 *
 * The queue belongs to a single Session and is only mutated from the
 * thread that owns it.
 */
class CONDUCTOR_EXPORT PromptQueue : public QObject
{
    Q_OBJECT

public:
    explicit PromptQueue(QObject *parent = nullptr);
    ~PromptQueue() override;

    const QList<PromptQueueItem> &items() const { return m_items; }
    int count() const { return m_items.size(); }
    bool isEmpty() const { return m_items.isEmpty(); }

    PromptQueueItem enqueue(const QString &text);
    bool remove(const QUuid &id);

    /**
     * Remove and return the item, or an invalid item if @p id is unknown
     */
    PromptQueueItem take(const QUuid &id);

    /**
     * Put a taken item back at @p index, clamped to the queue bounds
     */
    bool insert(int index, const PromptQueueItem &item);

    bool moveUp(const QUuid &id);
    bool moveDown(const QUuid &id);

    /**
     * Move an item to @p index, clamped to the queue bounds
     */
    bool moveTo(const QUuid &id, int index);

    void clear();

    /**
     * Replace the contents, e.g. from persisted state
     */
    void loadFrom(const QList<PromptQueueItem> &items);

    int indexOf(const QUuid &id) const;
    PromptQueueItem findById(const QUuid &id) const;

Q_SIGNALS:
    void queueChanged();

private:
    QList<PromptQueueItem> m_items;
};

} // namespace Conductor

#endif // PROMPTQUEUE_H
