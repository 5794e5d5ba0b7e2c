#include "calmerge/data/EventValidation.hpp"

#include <QRegularExpression>
#include <QUrl>

namespace calmerge {
namespace data {

namespace {
void checkLength(std::vector<core::ValidationError> &errors, const QString &value, int limit, const QString &field)
{
    if (value.size() > limit) {
        errors.push_back({field, QStringLiteral("%1 must contain at most %2 characters").arg(field).arg(limit)});
    }
}
} // namespace

bool isValidUrl(const QString &url)
{
    const QUrl parsed(url, QUrl::StrictMode);
    return parsed.isValid() && !parsed.scheme().isEmpty();
}

bool isValidColor(const QString &color)
{
    static const QRegularExpression pattern(QStringLiteral("^(#([0-9A-Fa-f]{3}|[0-9A-Fa-f]{6})|[A-Za-z]+)$"));
    return pattern.match(color).hasMatch();
}

std::vector<core::ValidationError> validateEvent(const CalendarEvent &event)
{
    std::vector<core::ValidationError> errors;

    if (event.title.trimmed().isEmpty()) {
        errors.push_back({QStringLiteral("title"), QStringLiteral("title is required")});
    }
    checkLength(errors, event.title, FieldLimits::Title, QStringLiteral("title"));
    checkLength(errors, event.location, FieldLimits::Location, QStringLiteral("location"));
    checkLength(errors, event.description, FieldLimits::Description, QStringLiteral("description"));
    checkLength(errors, event.recurrenceRule, FieldLimits::RecurrenceRule, QStringLiteral("rrule"));
    checkLength(errors, event.uid, FieldLimits::Uid, QStringLiteral("uid"));

    if (!event.start.isValid()) {
        errors.push_back({QStringLiteral("start"), QStringLiteral("start is required")});
    }
    if (!event.end.isValid()) {
        errors.push_back({QStringLiteral("end"), QStringLiteral("end is required")});
    }
    if (event.start.isValid() && event.end.isValid()) {
        if (!event.start.isComparableWith(event.end)) {
            errors.push_back({QStringLiteral("end"), QStringLiteral("start and end mix UTC and floating time")});
        } else if (event.end.secondsSinceEpoch() < event.start.secondsSinceEpoch()) {
            errors.push_back({QStringLiteral("end"), QStringLiteral("end must not be before start")});
        }
    }

    if (event.priority && (*event.priority < 0 || *event.priority > 9)) {
        errors.push_back({QStringLiteral("priority"), QStringLiteral("priority must be between 0 and 9")});
    }
    if (!event.url.isEmpty() && !isValidUrl(event.url)) {
        errors.push_back({QStringLiteral("url"), QStringLiteral("invalid URL")});
    }
    if (!event.color.isEmpty() && !isValidColor(event.color)) {
        errors.push_back({QStringLiteral("color"), QStringLiteral("invalid color, expected #RRGGBB")});
    }
    if (event.geo && (qAbs(event.geo->latitude) > 90.0 || qAbs(event.geo->longitude) > 180.0)) {
        errors.push_back({QStringLiteral("geo"), QStringLiteral("geo position out of range")});
    }
    if (event.organizer && event.organizer->email.trimmed().isEmpty()) {
        errors.push_back({QStringLiteral("organizer"), QStringLiteral("organizer requires an address")});
    }
    for (const auto &attendee : event.attendees) {
        if (attendee.email.trimmed().isEmpty()) {
            errors.push_back({QStringLiteral("attendees"), QStringLiteral("attendee requires an address")});
            break;
        }
    }
    return errors;
}

} // namespace data
} // namespace calmerge
