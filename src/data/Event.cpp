#include "calmerge/data/Event.hpp"

#include <QUuid>
#include <algorithm>

namespace calmerge {
namespace data {

bool RecurrenceDateSet::insert(const RecurrenceDate &date)
{
    if (!date.date.isValid() || contains(date)) {
        return false;
    }
    m_dates.push_back(date);
    return true;
}

bool RecurrenceDateSet::contains(const RecurrenceDate &date) const
{
    return std::find(m_dates.begin(), m_dates.end(), date) != m_dates.end();
}

std::vector<core::Instant> RecurrenceDateSet::datesOfType(RecurrenceDateType type) const
{
    std::vector<core::Instant> result;
    for (const auto &entry : m_dates) {
        if (entry.type == type) {
            result.push_back(entry.date);
        }
    }
    return result;
}

bool Attendee::operator==(const Attendee &other) const
{
    return name == other.name && email == other.email && role == other.role && status == other.status
        && rsvp == other.rsvp;
}

bool Alarm::operator==(const Alarm &other) const
{
    return action == other.action && relativeTrigger == other.relativeTrigger
        && absoluteTrigger == other.absoluteTrigger && summary == other.summary
        && description == other.description && repeatInterval == other.repeatInterval
        && repeat == other.repeat;
}

bool CalendarEvent::operator==(const CalendarEvent &other) const
{
    return uid == other.uid && title == other.title && start == other.start && end == other.end
        && description == other.description && location == other.location && status == other.status
        && eventClass == other.eventClass && transparency == other.transparency
        && priority == other.priority && organizer == other.organizer && attendees == other.attendees
        && alarms == other.alarms && categories == other.categories && resources == other.resources
        && recurrenceRule == other.recurrenceRule && recurrenceDates == other.recurrenceDates
        && recurrenceId == other.recurrenceId && sequence == other.sequence && url == other.url
        && geo == other.geo && comment == other.comment && contact == other.contact
        && relatedTo == other.relatedTo && color == other.color && created == other.created
        && lastModified == other.lastModified;
}

QString generateUid()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces) + QStringLiteral("@calmerge");
}

QString statusToString(EventStatus status)
{
    switch (status) {
    case EventStatus::Tentative:
        return QStringLiteral("TENTATIVE");
    case EventStatus::Cancelled:
        return QStringLiteral("CANCELLED");
    case EventStatus::Confirmed:
    default:
        return QStringLiteral("CONFIRMED");
    }
}

std::optional<EventStatus> statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("CONFIRMED")) {
        return EventStatus::Confirmed;
    }
    if (normalized == QLatin1String("TENTATIVE")) {
        return EventStatus::Tentative;
    }
    if (normalized == QLatin1String("CANCELLED")) {
        return EventStatus::Cancelled;
    }
    return std::nullopt;
}

QString classToString(EventClass eventClass)
{
    switch (eventClass) {
    case EventClass::Private:
        return QStringLiteral("PRIVATE");
    case EventClass::Confidential:
        return QStringLiteral("CONFIDENTIAL");
    case EventClass::Public:
    default:
        return QStringLiteral("PUBLIC");
    }
}

std::optional<EventClass> classFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("PUBLIC")) {
        return EventClass::Public;
    }
    if (normalized == QLatin1String("PRIVATE")) {
        return EventClass::Private;
    }
    if (normalized == QLatin1String("CONFIDENTIAL")) {
        return EventClass::Confidential;
    }
    return std::nullopt;
}

QString transparencyToString(Transparency transparency)
{
    return transparency == Transparency::Transparent ? QStringLiteral("TRANSPARENT") : QStringLiteral("OPAQUE");
}

std::optional<Transparency> transparencyFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("OPAQUE")) {
        return Transparency::Opaque;
    }
    if (normalized == QLatin1String("TRANSPARENT")) {
        return Transparency::Transparent;
    }
    return std::nullopt;
}

} // namespace data
} // namespace calmerge
