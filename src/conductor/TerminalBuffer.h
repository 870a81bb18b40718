/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALBUFFER_H
#define TERMINALBUFFER_H

#include "conductor_export.h"

#include <QByteArray>
#include <QReadWriteLock>

namespace Conductor
{

/**
 * TerminalBuffer is a fixed-capacity ring of raw terminal bytes.
 *
 * Positions handed out by the buffer are cumulative byte counts, not
 * physical indexes. A reader keeps the position returned from
 * writtenSince() and passes it back on the next poll; if the writer has
 * lapped the reader in the meantime the reader gets a full dump instead
 * of a torn range.
 *
 * All methods are safe to call from any thread.
 */
class CONDUCTOR_EXPORT TerminalBuffer
{
public:
    static constexpr int DefaultCapacity = 2 * 1024 * 1024;

    /**
     * Result of an incremental read
     */
    struct Chunk {
        QByteArray data;
        qint64 position = 0; ///< pass this back to the next writtenSince()
    };

    /**
     * @throws std::invalid_argument if @p capacity is not positive
     */
    explicit TerminalBuffer(int capacity = DefaultCapacity);

    TerminalBuffer(const TerminalBuffer &) = delete;
    TerminalBuffer &operator=(const TerminalBuffer &) = delete;

    int capacity() const { return m_capacity; }

    /**
     * Total number of bytes ever written. Never decreases.
     */
    qint64 totalBytesWritten() const;

    /**
     * Number of bytes currently retained (min(total, capacity))
     */
    int size() const;

    void write(const QByteArray &data);
    void write(const char *data, int length);

    /**
     * Return the whole retained window, oldest byte first.
     */
    QByteArray dumpAll() const;

    /**
     * Return the bytes written after @p position.
     *
     * - position >= totalBytesWritten(): empty data, position unchanged
     * - position older than totalBytesWritten() - capacity(): full dump
     * - otherwise: exactly the new bytes
     */
    Chunk writtenSince(qint64 position) const;

private:
    QByteArray copyRange(qint64 from, qint64 to) const;

    const int m_capacity;
    QByteArray m_data;
    qint64 m_total = 0;
    mutable QReadWriteLock m_lock;
};

} // namespace Conductor

#endif // TERMINALBUFFER_H
