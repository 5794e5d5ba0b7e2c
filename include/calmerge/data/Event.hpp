#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "calmerge/core/Duration.hpp"
#include "calmerge/core/Instant.hpp"

namespace calmerge {
namespace data {

enum class EventStatus
{
    Confirmed,
    Tentative,
    Cancelled,
};

enum class EventClass
{
    Public,
    Private,
    Confidential,
};

enum class Transparency
{
    Opaque,
    Transparent,
};

enum class RecurrenceDateType
{
    RDate,
    ExDate,
};

struct RecurrenceDate
{
    core::Instant date;
    RecurrenceDateType type = RecurrenceDateType::RDate;

    bool operator==(const RecurrenceDate &other) const
    {
        return type == other.type && date == other.date;
    }
};

// Unique by (date, type); keeps insertion order so output stays stable.
class RecurrenceDateSet
{
public:
    bool insert(const RecurrenceDate &date);
    bool contains(const RecurrenceDate &date) const;
    std::vector<core::Instant> datesOfType(RecurrenceDateType type) const;

    const std::vector<RecurrenceDate> &dates() const { return m_dates; }
    std::size_t size() const { return m_dates.size(); }
    bool isEmpty() const { return m_dates.empty(); }

    bool operator==(const RecurrenceDateSet &other) const { return m_dates == other.m_dates; }

private:
    std::vector<RecurrenceDate> m_dates;
};

struct Organizer
{
    QString name;
    QString email;

    bool operator==(const Organizer &other) const { return name == other.name && email == other.email; }
};

struct GeoPosition
{
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const GeoPosition &other) const
    {
        return latitude == other.latitude && longitude == other.longitude;
    }
};

struct Attendee
{
    QString name;
    QString email;
    QString role;
    QString status;
    bool rsvp = false;

    bool operator==(const Attendee &other) const;
};

struct Alarm
{
    QString action;
    // Exactly one of the two triggers is set on a well-formed alarm.
    std::optional<core::Duration> relativeTrigger;
    std::optional<core::Instant> absoluteTrigger;
    QString summary;
    QString description;
    std::optional<core::Duration> repeatInterval;
    std::optional<int> repeat;

    bool operator==(const Alarm &other) const;
};

struct CalendarEvent
{
    QString uid;
    QString title;
    core::Instant start;
    core::Instant end;
    QString description;
    QString location;
    std::optional<EventStatus> status;
    std::optional<EventClass> eventClass;
    std::optional<Transparency> transparency;
    std::optional<int> priority;
    std::optional<Organizer> organizer;
    std::vector<Attendee> attendees;
    std::vector<Alarm> alarms;
    QStringList categories;
    QStringList resources;
    QString recurrenceRule; // RRULE value, stored and written back untouched
    RecurrenceDateSet recurrenceDates;
    std::optional<core::Instant> recurrenceId;
    int sequence = 0;
    QString url;
    std::optional<GeoPosition> geo;
    QString comment;
    QString contact;
    QString relatedTo;
    QString color;
    std::optional<core::Instant> created;
    std::optional<core::Instant> lastModified;

    bool isAllDay() const { return start.kind() == core::InstantKind::DateOnly; }
    bool operator==(const CalendarEvent &other) const;
    bool operator!=(const CalendarEvent &other) const { return !(*this == other); }
};

QString generateUid();

QString statusToString(EventStatus status);
std::optional<EventStatus> statusFromString(const QString &value);
QString classToString(EventClass eventClass);
std::optional<EventClass> classFromString(const QString &value);
QString transparencyToString(Transparency transparency);
std::optional<Transparency> transparencyFromString(const QString &value);

} // namespace data
} // namespace calmerge
