#include "calmerge/core/Instant.hpp"

namespace calmerge {
namespace core {

namespace {
constexpr qint64 SecondsPerDay = 24 * 60 * 60;

qint64 toEpochSeconds(const QDate &date, const QTime &time)
{
    return QDateTime(date, time, Qt::UTC).toSecsSinceEpoch();
}
} // namespace

Instant::Instant(InstantKind kind, qint64 seconds)
    : m_kind(kind)
    , m_seconds(seconds)
    , m_valid(true)
{
}

Instant Instant::utc(const QDate &date, const QTime &time)
{
    if (!date.isValid() || !time.isValid()) {
        return {};
    }
    return Instant(InstantKind::Utc, toEpochSeconds(date, QTime(time.hour(), time.minute(), time.second())));
}

Instant Instant::floating(const QDate &date, const QTime &time)
{
    if (!date.isValid() || !time.isValid()) {
        return {};
    }
    return Instant(InstantKind::Floating, toEpochSeconds(date, QTime(time.hour(), time.minute(), time.second())));
}

Instant Instant::dateOnly(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return Instant(InstantKind::DateOnly, toEpochSeconds(date, QTime(0, 0)));
}

Instant Instant::fromDateTime(const QDateTime &dateTime)
{
    if (!dateTime.isValid()) {
        return {};
    }
    if (dateTime.timeSpec() == Qt::UTC) {
        return utc(dateTime.date(), dateTime.time());
    }
    return floating(dateTime.date(), dateTime.time());
}

QDate Instant::date() const
{
    if (!m_valid) {
        return {};
    }
    return QDateTime::fromSecsSinceEpoch(m_seconds, Qt::UTC).date();
}

QTime Instant::time() const
{
    if (!m_valid) {
        return {};
    }
    return QDateTime::fromSecsSinceEpoch(m_seconds, Qt::UTC).time();
}

Instant Instant::addSeconds(qint64 seconds) const
{
    if (!m_valid) {
        return {};
    }
    if (m_kind == InstantKind::DateOnly && seconds % SecondsPerDay != 0) {
        return Instant(InstantKind::Floating, m_seconds + seconds);
    }
    return Instant(m_kind, m_seconds + seconds);
}

Instant Instant::addDays(qint64 days) const
{
    return addSeconds(days * SecondsPerDay);
}

bool Instant::isComparableWith(const Instant &other) const
{
    if (!m_valid || !other.m_valid) {
        return false;
    }
    return m_kind == other.m_kind || m_kind == InstantKind::DateOnly
        || other.m_kind == InstantKind::DateOnly;
}

bool Instant::operator==(const Instant &other) const
{
    if (m_valid != other.m_valid) {
        return false;
    }
    if (!m_valid) {
        return true;
    }
    return m_kind == other.m_kind && m_seconds == other.m_seconds;
}

bool Instant::operator<(const Instant &other) const
{
    if (m_seconds == other.m_seconds) {
        return static_cast<int>(m_kind) < static_cast<int>(other.m_kind);
    }
    return m_seconds < other.m_seconds;
}

} // namespace core
} // namespace calmerge
