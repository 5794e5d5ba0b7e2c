#pragma once

#include <QDate>
#include <QDateTime>
#include <QHash>
#include <QTime>
#include <QtGlobal>

namespace calmerge {
namespace core {

enum class InstantKind
{
    Utc,
    Floating,
    DateOnly,
};

// Seconds count from 1970-01-01T00:00:00 on the instant's own clock.
class Instant
{
public:
    Instant() = default;

    static Instant utc(const QDate &date, const QTime &time);
    static Instant floating(const QDate &date, const QTime &time);
    static Instant dateOnly(const QDate &date);
    // Milliseconds are dropped. A UTC QDateTime gives a Utc instant, any other
    // Qt::TimeSpec gives a Floating one in the QDateTime's own wall clock.
    static Instant fromDateTime(const QDateTime &dateTime);

    bool isValid() const { return m_valid; }
    InstantKind kind() const { return m_kind; }
    qint64 secondsSinceEpoch() const { return m_seconds; }

    QDate date() const;
    QTime time() const;

    // A DateOnly instant stays DateOnly only when whole days are added.
    Instant addSeconds(qint64 seconds) const;
    Instant addDays(qint64 days) const;

    // True when both sides may be ordered against each other: equal kinds,
    // or one side DateOnly.
    bool isComparableWith(const Instant &other) const;

    bool operator==(const Instant &other) const;
    bool operator!=(const Instant &other) const { return !(*this == other); }
    // Total order for sorting and map keys: by seconds, then by kind. Only
    // meaningful as a time order between comparable instants.
    bool operator<(const Instant &other) const;

private:
    Instant(InstantKind kind, qint64 seconds);

    InstantKind m_kind = InstantKind::Floating;
    qint64 m_seconds = 0;
    bool m_valid = false;
};

inline uint qHash(const Instant &instant, uint seed = 0) noexcept
{
    return ::qHash(instant.secondsSinceEpoch(), seed) ^ (static_cast<uint>(instant.kind()) << 1);
}

} // namespace core
} // namespace calmerge
