/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalBuffer.h"

#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace Conductor
{

TerminalBuffer::TerminalBuffer(int capacity)
    : m_capacity(capacity)
{
    if (capacity <= 0) {
        throw std::invalid_argument("TerminalBuffer capacity must be positive");
    }
    m_data.resize(capacity);
}

qint64 TerminalBuffer::totalBytesWritten() const
{
    QReadLocker locker(&m_lock);
    return m_total;
}

int TerminalBuffer::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(std::min<qint64>(m_total, m_capacity));
}

void TerminalBuffer::write(const QByteArray &data)
{
    write(data.constData(), static_cast<int>(data.size()));
}

void TerminalBuffer::write(const char *data, int length)
{
    if (!data || length <= 0) {
        return;
    }

    QWriteLocker locker(&m_lock);

    // Only the tail of an oversized write can survive
    const int skipped = length > m_capacity ? length - m_capacity : 0;
    const char *src = data + skipped;
    int remaining = length - skipped;

    qint64 writePos = (m_total + skipped) % m_capacity;
    char *dst = m_data.data();
    while (remaining > 0) {
        const int chunk = std::min<qint64>(remaining, m_capacity - writePos);
        std::memcpy(dst + writePos, src, chunk);
        src += chunk;
        remaining -= chunk;
        writePos = (writePos + chunk) % m_capacity;
    }

    m_total += length;
}

QByteArray TerminalBuffer::copyRange(qint64 from, qint64 to) const
{
    // Caller holds the lock; from/to are absolute positions inside the window
    QByteArray out;
    const qint64 length = to - from;
    if (length <= 0) {
        return out;
    }
    out.resize(static_cast<int>(length));

    const qint64 start = from % m_capacity;
    const qint64 firstPart = std::min<qint64>(length, m_capacity - start);
    std::memcpy(out.data(), m_data.constData() + start, firstPart);
    if (firstPart < length) {
        std::memcpy(out.data() + firstPart, m_data.constData(), length - firstPart);
    }
    return out;
}

QByteArray TerminalBuffer::dumpAll() const
{
    QReadLocker locker(&m_lock);
    const qint64 oldest = std::max<qint64>(0, m_total - m_capacity);
    return copyRange(oldest, m_total);
}

TerminalBuffer::Chunk TerminalBuffer::writtenSince(qint64 position) const
{
    QReadLocker locker(&m_lock);

    Chunk chunk;
    if (position >= m_total) {
        chunk.position = m_total;
        return chunk;
    }

    const qint64 oldest = std::max<qint64>(0, m_total - m_capacity);
    chunk.data = copyRange(std::max(position, oldest), m_total);
    chunk.position = m_total;
    return chunk;
}

} // namespace Conductor
