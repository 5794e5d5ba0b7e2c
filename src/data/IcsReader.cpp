#include "calmerge/data/IcsReader.hpp"

#include "calmerge/core/Logging.hpp"
#include "calmerge/core/TemporalCodec.hpp"
#include "calmerge/data/EventValidation.hpp"
#include "calmerge/data/IcsText.hpp"

#include <QFile>
#include <QTextStream>

namespace calmerge {
namespace data {

namespace {
struct PendingEvent
{
    CalendarEvent event;
    std::optional<core::Duration> duration;
    bool hasEnd = false;
    bool broken = false;
};

struct PendingAlarm
{
    Alarm alarm;
    bool broken = false;
};

QString stripMailto(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.startsWith(QLatin1String("mailto:"), Qt::CaseInsensitive)) {
        return trimmed.mid(7);
    }
    return trimmed;
}

std::optional<GeoPosition> parseGeo(const QString &value)
{
    const QStringList parts = value.trimmed().split(QLatin1Char(';'));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool latitudeOk = false;
    bool longitudeOk = false;
    GeoPosition position;
    position.latitude = parts.at(0).trimmed().toDouble(&latitudeOk);
    position.longitude = parts.at(1).trimmed().toDouble(&longitudeOk);
    if (!latitudeOk || !longitudeOk || qAbs(position.latitude) > 90.0 || qAbs(position.longitude) > 180.0) {
        return std::nullopt;
    }
    return position;
}

std::optional<core::Instant> parseDateValue(const ContentLine &line, const QString &text, core::ParseError *error)
{
    if (line.hasParameter(QStringLiteral("TZID"))) {
        qCDebug(lcCalmergeImport) << line.name << "with TZID" << line.parameter(QStringLiteral("TZID"))
                                  << "is read as floating time";
    }
    auto instant = core::parseInstant(text.trimmed(), error);
    if (!instant && error) {
        error->field = line.name;
    }
    return instant;
}
} // namespace

ImportResult IcsReader::read(const QString &text) const
{
    ImportResult result;
    QStringList components;
    PendingEvent current;
    PendingAlarm currentAlarm;

    auto eventLabel = [&]() {
        return current.event.title.isEmpty() ? QStringLiteral("(untitled)") : current.event.title;
    };

    auto skipField = [&](const core::ParseError &error) {
        ++result.skippedFields;
        result.parseErrors.push_back(error);
        result.warnings << QStringLiteral("Event \"%1\": %2").arg(eventLabel(), error.toString());
        qCWarning(lcCalmergeImport) << "skipping field" << error.toString();
    };

    auto invalidValue = [&](const ContentLine &line, const QString &reason) {
        skipField(core::ParseError{line.name, line.value, reason});
    };

    // A required date that fails to parse breaks the whole event, which is
    // then counted as skipped instead of the field.
    auto readInstant = [&](const ContentLine &line, bool required) -> std::optional<core::Instant> {
        core::ParseError error;
        auto instant = parseDateValue(line, line.value, &error);
        if (!instant) {
            if (required) {
                result.parseErrors.push_back(error);
                result.warnings << QStringLiteral("Event \"%1\": %2").arg(eventLabel(), error.toString());
            } else {
                skipField(error);
            }
        }
        return instant;
    };

    auto readRecurrenceDates = [&](const ContentLine &line, RecurrenceDateType type) {
        if (line.parameter(QStringLiteral("VALUE")).compare(QLatin1String("PERIOD"), Qt::CaseInsensitive) == 0) {
            invalidValue(line, QStringLiteral("PERIOD values are not supported"));
            return;
        }
        const QStringList values = line.value.split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString &value : values) {
            core::ParseError error;
            const auto instant = parseDateValue(line, value, &error);
            if (!instant) {
                skipField(error);
                continue;
            }
            current.event.recurrenceDates.insert(RecurrenceDate{*instant, type});
        }
    };

    auto finalizeEvent = [&]() {
        CalendarEvent &event = current.event;
        if (current.broken) {
            ++result.skippedEvents;
            result.warnings << QStringLiteral("Event \"%1\" has an unreadable date and was skipped").arg(eventLabel());
            qCWarning(lcCalmergeImport) << "skipping event" << eventLabel() << "with unreadable dates";
            return;
        }
        if (!event.start.isValid()) {
            ++result.skippedEvents;
            result.validationErrors.push_back({QStringLiteral("start"), QStringLiteral("start is required")});
            result.warnings << QStringLiteral("Event \"%1\" has no DTSTART and was skipped").arg(eventLabel());
            qCWarning(lcCalmergeImport) << "skipping event" << eventLabel() << "without DTSTART";
            return;
        }
        if (!current.hasEnd) {
            if (current.duration) {
                event.end = event.start.addSeconds(current.duration->toSeconds());
            } else if (event.isAllDay()) {
                event.end = event.start.addDays(1);
            } else {
                event.end = event.start;
            }
        }
        if (event.uid.isEmpty()) {
            event.uid = generateUid();
        }
        const auto errors = validateEvent(event);
        if (!errors.empty()) {
            ++result.skippedEvents;
            for (const auto &error : errors) {
                result.validationErrors.push_back(error);
                result.warnings << QStringLiteral("Event \"%1\" was skipped: %2").arg(eventLabel(), error.message);
            }
            qCWarning(lcCalmergeImport) << "skipping invalid event" << eventLabel() << errors.front().message;
            return;
        }
        result.events.push_back(std::move(event));
    };

    auto finalizeAlarm = [&]() {
        Alarm &alarm = currentAlarm.alarm;
        const bool hasTrigger = alarm.relativeTrigger.has_value() || alarm.absoluteTrigger.has_value();
        if (currentAlarm.broken || alarm.action.isEmpty() || !hasTrigger) {
            ++result.skippedFields;
            result.warnings << QStringLiteral("Event \"%1\": alarm without a usable ACTION or TRIGGER was dropped")
                                   .arg(eventLabel());
            return;
        }
        current.event.alarms.push_back(alarm);
    };

    auto handleEventProperty = [&](const ContentLine &line) {
        const QString &name = line.name;
        CalendarEvent &event = current.event;
        if (name == QLatin1String("SUMMARY")) {
            event.title = unescapeText(line.value);
        } else if (name == QLatin1String("DESCRIPTION")) {
            event.description = unescapeText(line.value);
        } else if (name == QLatin1String("LOCATION")) {
            event.location = unescapeText(line.value);
        } else if (name == QLatin1String("UID")) {
            event.uid = line.value.trimmed();
        } else if (name == QLatin1String("DTSTART")) {
            const auto instant = readInstant(line, true);
            if (instant) {
                event.start = *instant;
            } else {
                current.broken = true;
            }
        } else if (name == QLatin1String("DTEND")) {
            const auto instant = readInstant(line, true);
            if (instant) {
                event.end = *instant;
                current.hasEnd = true;
            } else {
                current.broken = true;
            }
        } else if (name == QLatin1String("DURATION")) {
            core::ParseError error;
            current.duration = core::parseDuration(line.value.trimmed(), &error);
            if (!current.duration) {
                error.field = name;
                skipField(error);
            }
        } else if (name == QLatin1String("STATUS")) {
            event.status = statusFromString(line.value);
            if (!event.status) {
                invalidValue(line, QStringLiteral("unknown status"));
            }
        } else if (name == QLatin1String("CLASS")) {
            event.eventClass = classFromString(line.value);
            if (!event.eventClass) {
                invalidValue(line, QStringLiteral("unknown classification"));
            }
        } else if (name == QLatin1String("TRANSP")) {
            event.transparency = transparencyFromString(line.value);
            if (!event.transparency) {
                invalidValue(line, QStringLiteral("unknown transparency"));
            }
        } else if (name == QLatin1String("PRIORITY")) {
            bool ok = false;
            const int priority = line.value.trimmed().toInt(&ok);
            if (ok && priority >= 0 && priority <= 9) {
                event.priority = priority;
            } else {
                invalidValue(line, QStringLiteral("priority must be an integer between 0 and 9"));
            }
        } else if (name == QLatin1String("SEQUENCE")) {
            bool ok = false;
            const int sequence = line.value.trimmed().toInt(&ok);
            if (ok && sequence >= 0) {
                event.sequence = sequence;
            } else {
                invalidValue(line, QStringLiteral("sequence must be a non-negative integer"));
            }
        } else if (name == QLatin1String("RRULE")) {
            event.recurrenceRule = line.value.trimmed();
        } else if (name == QLatin1String("RDATE")) {
            readRecurrenceDates(line, RecurrenceDateType::RDate);
        } else if (name == QLatin1String("EXDATE")) {
            readRecurrenceDates(line, RecurrenceDateType::ExDate);
        } else if (name == QLatin1String("RECURRENCE-ID")) {
            const auto instant = readInstant(line, false);
            if (instant) {
                event.recurrenceId = *instant;
            }
        } else if (name == QLatin1String("CATEGORIES")) {
            event.categories << splitTextList(line.value);
        } else if (name == QLatin1String("RESOURCES")) {
            event.resources << splitTextList(line.value);
        } else if (name == QLatin1String("URL")) {
            if (isValidUrl(line.value.trimmed())) {
                event.url = line.value.trimmed();
            } else {
                invalidValue(line, QStringLiteral("not a valid URL"));
            }
        } else if (name == QLatin1String("GEO")) {
            const auto position = parseGeo(line.value);
            if (position) {
                event.geo = position;
            } else {
                invalidValue(line, QStringLiteral("GEO must be latitude;longitude in degrees"));
            }
        } else if (name == QLatin1String("COMMENT")) {
            event.comment = unescapeText(line.value);
        } else if (name == QLatin1String("CONTACT")) {
            event.contact = unescapeText(line.value);
        } else if (name == QLatin1String("RELATED-TO")) {
            event.relatedTo = unescapeText(line.value).trimmed();
        } else if (name == QLatin1String("COLOR")) {
            if (isValidColor(line.value.trimmed())) {
                event.color = line.value.trimmed();
            } else {
                invalidValue(line, QStringLiteral("not a valid color"));
            }
        } else if (name == QLatin1String("CREATED")) {
            event.created = readInstant(line, false);
        } else if (name == QLatin1String("LAST-MODIFIED")) {
            event.lastModified = readInstant(line, false);
        } else if (name == QLatin1String("ORGANIZER")) {
            Organizer organizer;
            organizer.email = stripMailto(line.value);
            if (organizer.email.isEmpty()) {
                invalidValue(line, QStringLiteral("organizer without address"));
                return;
            }
            organizer.name = line.parameter(QStringLiteral("CN"));
            event.organizer = organizer;
        } else if (name == QLatin1String("ATTENDEE")) {
            Attendee attendee;
            attendee.email = stripMailto(line.value);
            if (attendee.email.isEmpty()) {
                invalidValue(line, QStringLiteral("attendee without address"));
                return;
            }
            attendee.name = line.parameter(QStringLiteral("CN"));
            attendee.role = line.parameter(QStringLiteral("ROLE")).toUpper();
            attendee.status = line.parameter(QStringLiteral("PARTSTAT")).toUpper();
            attendee.rsvp = line.parameter(QStringLiteral("RSVP")).compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
            event.attendees.push_back(attendee);
        }
    };

    auto handleAlarmProperty = [&](const ContentLine &line) {
        const QString &name = line.name;
        Alarm &alarm = currentAlarm.alarm;
        if (name == QLatin1String("ACTION")) {
            alarm.action = line.value.trimmed().toUpper();
        } else if (name == QLatin1String("TRIGGER")) {
            const QString value = line.value.trimmed();
            const bool absolute = line.parameter(QStringLiteral("VALUE")).compare(QLatin1String("DATE-TIME"), Qt::CaseInsensitive) == 0
                || (!value.isEmpty() && value.at(0).isDigit());
            core::ParseError error;
            if (absolute) {
                alarm.absoluteTrigger = core::parseInstant(value, &error);
                currentAlarm.broken = !alarm.absoluteTrigger.has_value();
            } else {
                alarm.relativeTrigger = core::parseDuration(value, &error);
                currentAlarm.broken = !alarm.relativeTrigger.has_value();
            }
            if (currentAlarm.broken) {
                error.field = name;
                result.parseErrors.push_back(error);
                qCWarning(lcCalmergeImport) << "unreadable alarm trigger" << error.toString();
            }
        } else if (name == QLatin1String("SUMMARY")) {
            alarm.summary = unescapeText(line.value);
        } else if (name == QLatin1String("DESCRIPTION")) {
            alarm.description = unescapeText(line.value);
        } else if (name == QLatin1String("DURATION")) {
            core::ParseError error;
            alarm.repeatInterval = core::parseDuration(line.value.trimmed(), &error);
            if (!alarm.repeatInterval) {
                error.field = QStringLiteral("VALARM/DURATION");
                skipField(error);
            }
        } else if (name == QLatin1String("REPEAT")) {
            bool ok = false;
            const int repeat = line.value.trimmed().toInt(&ok);
            if (ok && repeat >= 0) {
                alarm.repeat = repeat;
            } else {
                invalidValue(line, QStringLiteral("repeat must be a non-negative integer"));
            }
        }
    };

    auto handleLine = [&](const QString &rawLine) {
        const auto parsed = parseContentLine(rawLine);
        if (!parsed) {
            if (components.contains(QLatin1String("VEVENT"))) {
                skipField(core::ParseError{QStringLiteral("CONTENT-LINE"), rawLine, QStringLiteral("not a content line")});
            }
            return;
        }
        const ContentLine &line = *parsed;
        const QString top = components.isEmpty() ? QString() : components.last();

        if (line.name == QLatin1String("BEGIN")) {
            const QString component = line.value.trimmed().toUpper();
            if (component == QLatin1String("VEVENT") && !components.contains(QLatin1String("VEVENT"))) {
                current = PendingEvent{};
            } else if (component == QLatin1String("VALARM") && top == QLatin1String("VEVENT")) {
                currentAlarm = PendingAlarm{};
            }
            components.append(component);
            return;
        }
        if (line.name == QLatin1String("END")) {
            const QString component = line.value.trimmed().toUpper();
            if (top != component) {
                result.warnings << QStringLiteral("Ignoring END:%1 without matching BEGIN").arg(component);
                return;
            }
            components.removeLast();
            if (component == QLatin1String("VEVENT")) {
                finalizeEvent();
            } else if (component == QLatin1String("VALARM") && components.endsWith(QStringLiteral("VEVENT"))) {
                finalizeAlarm();
            }
            return;
        }

        if (top == QLatin1String("VEVENT")) {
            handleEventProperty(line);
        } else if (top == QLatin1String("VALARM") && components.size() >= 2
                   && components.at(components.size() - 2) == QLatin1String("VEVENT")) {
            handleAlarmProperty(line);
        } else if (top == QLatin1String("VCALENDAR")) {
            if (line.name == QLatin1String("X-WR-CALNAME")) {
                result.calendarName = unescapeText(line.value);
            } else if (line.name == QLatin1String("COLOR") || line.name == QLatin1String("X-APPLE-CALENDAR-COLOR")) {
                result.calendarColor = line.value.trimmed();
            } else if (line.name == QLatin1String("SOURCE")) {
                const QUrl source(line.value.trimmed(), QUrl::StrictMode);
                if (source.isValid() && !source.scheme().isEmpty()) {
                    result.calendarSource = source;
                } else {
                    result.warnings << QStringLiteral("Ignoring calendar SOURCE %1").arg(line.value);
                }
            }
        }
    };

    const QStringList lines = unfoldLines(text);
    for (const QString &line : lines) {
        handleLine(line);
    }

    if (components.contains(QLatin1String("VEVENT"))) {
        ++result.skippedEvents;
        result.warnings << QStringLiteral("Event \"%1\" is not terminated and was skipped").arg(eventLabel());
    }

    qCInfo(lcCalmergeImport) << "read" << result.events.size() << "events," << result.skippedEvents
                             << "skipped events," << result.skippedFields << "skipped fields";
    return result;
}

ImportResult IcsReader::readFile(const QString &filePath, bool *ok) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcCalmergeImport) << "cannot open" << filePath << file.errorString();
        if (ok) {
            *ok = false;
        }
        return {};
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    if (ok) {
        *ok = true;
    }
    return read(stream.readAll());
}

} // namespace data
} // namespace calmerge
