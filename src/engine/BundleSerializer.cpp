#include "calmerge/engine/BundleSerializer.hpp"

#include "calmerge/core/Logging.hpp"
#include "calmerge/core/TemporalCodec.hpp"
#include "calmerge/data/IcsText.hpp"
#include "calmerge/engine/DuplicateResolver.hpp"

#include <QLocale>
#include <QUrl>

namespace calmerge {
namespace engine {

namespace {
QString quoteParameter(const QString &value)
{
    QString cleaned = value;
    cleaned.remove(QLatin1Char('"'));
    if (cleaned.contains(QLatin1Char(':')) || cleaned.contains(QLatin1Char(';')) || cleaned.contains(QLatin1Char(','))) {
        return QStringLiteral("\"%1\"").arg(cleaned);
    }
    return cleaned;
}

QString dateProperty(const QString &name, const core::Instant &instant)
{
    if (instant.kind() == core::InstantKind::DateOnly) {
        return name + QStringLiteral(";VALUE=DATE:") + core::formatInstant(instant);
    }
    return name + QLatin1Char(':') + core::formatInstant(instant);
}

class DocumentWriter
{
public:
    void line(const QString &content) { m_text += data::foldLine(content); }

    void header(const BundleOptions &options, const QString &color, const QUrl &source = QUrl())
    {
        line(QStringLiteral("BEGIN:VCALENDAR"));
        line(QStringLiteral("VERSION:2.0"));
        line(QStringLiteral("PRODID:") + options.productId);
        line(QStringLiteral("CALSCALE:GREGORIAN"));
        line(QStringLiteral("METHOD:PUBLISH"));
        if (!options.name.isEmpty()) {
            line(QStringLiteral("X-WR-CALNAME:") + data::escapeText(options.name));
        }
        if (!color.isEmpty()) {
            line(QStringLiteral("COLOR:") + color);
        }
        if (!source.isEmpty()) {
            line(QStringLiteral("SOURCE;VALUE=URI:") + QString::fromUtf8(source.toEncoded()));
        }
    }

    void event(const data::CalendarEvent &event, const QString &stamp);
    void alarm(const data::Alarm &alarm);

    QString finish()
    {
        line(QStringLiteral("END:VCALENDAR"));
        return m_text;
    }

private:
    QString m_text;
};

void DocumentWriter::event(const data::CalendarEvent &event, const QString &stamp)
{
    line(QStringLiteral("BEGIN:VEVENT"));
    line(QStringLiteral("UID:") + (event.uid.isEmpty() ? data::generateUid() : event.uid));
    line(QStringLiteral("DTSTAMP:") + stamp);
    line(dateProperty(QStringLiteral("DTSTART"), event.start));
    line(dateProperty(QStringLiteral("DTEND"), event.end));
    line(QStringLiteral("SEQUENCE:%1").arg(event.sequence));
    line(QStringLiteral("SUMMARY:") + data::escapeText(event.title));
    if (!event.description.isEmpty()) {
        line(QStringLiteral("DESCRIPTION:") + data::escapeText(event.description));
    }
    if (!event.location.isEmpty()) {
        line(QStringLiteral("LOCATION:") + data::escapeText(event.location));
    }
    if (event.status) {
        line(QStringLiteral("STATUS:") + data::statusToString(*event.status));
    }
    if (event.eventClass) {
        line(QStringLiteral("CLASS:") + data::classToString(*event.eventClass));
    }
    if (event.transparency) {
        line(QStringLiteral("TRANSP:") + data::transparencyToString(*event.transparency));
    }
    if (event.priority) {
        line(QStringLiteral("PRIORITY:%1").arg(*event.priority));
    }
    if (!event.categories.isEmpty()) {
        line(QStringLiteral("CATEGORIES:") + data::joinTextList(event.categories));
    }
    if (!event.resources.isEmpty()) {
        line(QStringLiteral("RESOURCES:") + data::joinTextList(event.resources));
    }
    if (!event.recurrenceRule.isEmpty()) {
        line(QStringLiteral("RRULE:") + event.recurrenceRule);
    }
    for (const auto &entry : event.recurrenceDates.dates()) {
        const QString name = entry.type == data::RecurrenceDateType::RDate ? QStringLiteral("RDATE") : QStringLiteral("EXDATE");
        line(dateProperty(name, entry.date));
    }
    if (event.recurrenceId) {
        line(dateProperty(QStringLiteral("RECURRENCE-ID"), *event.recurrenceId));
    }
    if (!event.url.isEmpty()) {
        line(QStringLiteral("URL:") + event.url);
    }
    if (event.geo) {
        line(QStringLiteral("GEO:%1;%2")
                 .arg(QString::number(event.geo->latitude, 'g', QLocale::FloatingPointShortest),
                      QString::number(event.geo->longitude, 'g', QLocale::FloatingPointShortest)));
    }
    if (!event.comment.isEmpty()) {
        line(QStringLiteral("COMMENT:") + data::escapeText(event.comment));
    }
    if (!event.contact.isEmpty()) {
        line(QStringLiteral("CONTACT:") + data::escapeText(event.contact));
    }
    if (!event.relatedTo.isEmpty()) {
        line(QStringLiteral("RELATED-TO:") + data::escapeText(event.relatedTo));
    }
    if (!event.color.isEmpty()) {
        line(QStringLiteral("COLOR:") + event.color);
    }
    if (event.created) {
        line(dateProperty(QStringLiteral("CREATED"), *event.created));
    }
    if (event.lastModified) {
        line(dateProperty(QStringLiteral("LAST-MODIFIED"), *event.lastModified));
    }
    if (event.organizer) {
        QString organizer = QStringLiteral("ORGANIZER");
        if (!event.organizer->name.isEmpty()) {
            organizer += QStringLiteral(";CN=") + quoteParameter(event.organizer->name);
        }
        line(organizer + QStringLiteral(":mailto:") + event.organizer->email);
    }
    for (const auto &attendee : event.attendees) {
        QString attendeeLine = QStringLiteral("ATTENDEE");
        if (!attendee.name.isEmpty()) {
            attendeeLine += QStringLiteral(";CN=") + quoteParameter(attendee.name);
        }
        if (!attendee.role.isEmpty()) {
            attendeeLine += QStringLiteral(";ROLE=") + attendee.role;
        }
        if (!attendee.status.isEmpty()) {
            attendeeLine += QStringLiteral(";PARTSTAT=") + attendee.status;
        }
        if (attendee.rsvp) {
            attendeeLine += QStringLiteral(";RSVP=TRUE");
        }
        line(attendeeLine + QStringLiteral(":mailto:") + attendee.email);
    }
    for (const auto &entry : event.alarms) {
        alarm(entry);
    }
    line(QStringLiteral("END:VEVENT"));
}

void DocumentWriter::alarm(const data::Alarm &alarm)
{
    line(QStringLiteral("BEGIN:VALARM"));
    if (alarm.absoluteTrigger) {
        line(QStringLiteral("TRIGGER;VALUE=DATE-TIME:") + core::formatInstant(*alarm.absoluteTrigger));
    } else if (alarm.relativeTrigger) {
        line(QStringLiteral("TRIGGER:") + core::formatDuration(*alarm.relativeTrigger));
    }
    line(QStringLiteral("ACTION:") + alarm.action);
    if (!alarm.summary.isEmpty()) {
        line(QStringLiteral("SUMMARY:") + data::escapeText(alarm.summary));
    }
    if (!alarm.description.isEmpty()) {
        line(QStringLiteral("DESCRIPTION:") + data::escapeText(alarm.description));
    }
    if (alarm.repeatInterval) {
        line(QStringLiteral("DURATION:") + core::formatDuration(*alarm.repeatInterval));
    }
    if (alarm.repeat) {
        line(QStringLiteral("REPEAT:%1").arg(*alarm.repeat));
    }
    line(QStringLiteral("END:VALARM"));
}

QString stampFor(const BundleOptions &options)
{
    const QDateTime generatedAt = options.generatedAt.isValid() ? options.generatedAt : QDateTime::currentDateTimeUtc();
    return core::formatInstant(core::Instant::fromDateTime(generatedAt.toUTC()));
}
} // namespace

QString serializeBundle(const std::vector<data::Calendar> &calendars, bool removeDuplicates, const BundleOptions &options)
{
    std::vector<data::CalendarEvent> combined;
    for (const auto &calendar : calendars) {
        combined.insert(combined.end(), calendar.events.begin(), calendar.events.end());
    }
    const std::size_t total = combined.size();
    if (removeDuplicates) {
        combined = resolve(combined, DuplicatePolicy{true}).kept;
    }

    const QString stamp = stampFor(options);
    DocumentWriter writer;
    writer.header(options, QString());
    for (const auto &event : combined) {
        writer.event(event, stamp);
    }
    qCInfo(lcCalmergeEngine) << "serialized bundle of" << calendars.size() << "calendars:" << combined.size()
                             << "of" << total << "events";
    return writer.finish();
}

QString writeCalendar(const data::Calendar &calendar, const BundleOptions &options)
{
    BundleOptions effective = options;
    if (effective.name.isEmpty()) {
        effective.name = calendar.name;
    }
    const QString stamp = stampFor(effective);
    DocumentWriter writer;
    writer.header(effective, calendar.color, calendar.sourceUrl);
    for (const auto &event : calendar.events) {
        writer.event(event, stamp);
    }
    return writer.finish();
}

} // namespace engine
} // namespace calmerge
