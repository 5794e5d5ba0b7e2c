#include "calmerge/core/TemporalCodec.hpp"

#include "calmerge/core/Logging.hpp"

#include <QDate>
#include <QTime>

namespace calmerge {
namespace core {

namespace {
constexpr int DateLength = 8;
constexpr int DateTimeLength = 15;
constexpr int MaxDurationDigits = 12;

bool fail(ParseError *error, const QString &field, const QString &text, const QString &reason)
{
    qCDebug(lcCalmergeCodec) << "rejecting" << field << "value" << text << ':' << reason;
    if (error) {
        *error = ParseError{field, text, reason};
    }
    return false;
}

bool readDigits(const QString &text, int position, int count, int *value)
{
    int result = 0;
    for (int i = position; i < position + count; ++i) {
        const QChar ch = text.at(i);
        if (ch < QLatin1Char('0') || ch > QLatin1Char('9')) {
            return false;
        }
        result = result * 10 + (ch.unicode() - '0');
    }
    *value = result;
    return true;
}

bool readDate(const QString &text, const QString &field, QDate *date, ParseError *error)
{
    int year = 0;
    int month = 0;
    int day = 0;
    if (!readDigits(text, 0, 4, &year) || !readDigits(text, 4, 2, &month) || !readDigits(text, 6, 2, &day)) {
        return fail(error, field, text, QStringLiteral("date contains a non-digit character"));
    }
    if (month < 1 || month > 12) {
        return fail(error, field, text, QStringLiteral("month %1 is out of range").arg(month));
    }
    if (day < 1 || day > 31) {
        return fail(error, field, text, QStringLiteral("day %1 is out of range").arg(day));
    }
    const QDate parsed(year, month, day);
    if (!parsed.isValid()) {
        return fail(error, field, text, QStringLiteral("date does not exist"));
    }
    *date = parsed;
    return true;
}

bool readTime(const QString &text, const QString &field, QTime *time, ParseError *error)
{
    if (text.at(DateLength) != QLatin1Char('T')) {
        return fail(error, field, text, QStringLiteral("expected 'T' between date and time"));
    }
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!readDigits(text, 9, 2, &hour) || !readDigits(text, 11, 2, &minute) || !readDigits(text, 13, 2, &second)) {
        return fail(error, field, text, QStringLiteral("time contains a non-digit character"));
    }
    if (hour > 23) {
        return fail(error, field, text, QStringLiteral("hour %1 is out of range").arg(hour));
    }
    if (minute > 59) {
        return fail(error, field, text, QStringLiteral("minute %1 is out of range").arg(minute));
    }
    if (second > 59) {
        return fail(error, field, text, QStringLiteral("second %1 is out of range").arg(second));
    }
    *time = QTime(hour, minute, second);
    return true;
}

// Reads "<digits><designator>" at position. Returns false without touching
// the outputs when the designator does not follow.
bool readComponent(const QString &text, int *position, QChar designator, qint64 *value, bool *tooLarge)
{
    int end = *position;
    while (end < text.size() && text.at(end).isDigit() && text.at(end).unicode() < 128) {
        ++end;
    }
    if (end == *position || end >= text.size() || text.at(end) != designator) {
        return false;
    }
    if (end - *position > MaxDurationDigits) {
        *tooLarge = true;
        return false;
    }
    *value = text.mid(*position, end - *position).toLongLong();
    *position = end + 1;
    return true;
}
} // namespace

QString ParseError::toString() const
{
    return QStringLiteral("%1: invalid value \"%2\" (%3)").arg(field, text, reason);
}

std::optional<Instant> parseInstant(const QString &text, ParseError *error)
{
    if (text.size() == DateLength) {
        QDate date;
        if (!readDate(text, QStringLiteral("DATE"), &date, error)) {
            return std::nullopt;
        }
        return Instant::dateOnly(date);
    }

    const QString field = QStringLiteral("DATE-TIME");
    bool utc = false;
    if (text.size() == DateTimeLength + 1) {
        if (text.at(DateTimeLength) != QLatin1Char('Z')) {
            fail(error, field, text, QStringLiteral("only a trailing 'Z' may follow the time"));
            return std::nullopt;
        }
        utc = true;
    } else if (text.size() != DateTimeLength) {
        fail(error, field, text, QStringLiteral("unexpected length %1").arg(text.size()));
        return std::nullopt;
    }

    QDate date;
    QTime time;
    if (!readDate(text, field, &date, error) || !readTime(text, field, &time, error)) {
        return std::nullopt;
    }
    return utc ? Instant::utc(date, time) : Instant::floating(date, time);
}

QString formatInstant(const Instant &instant)
{
    if (!instant.isValid()) {
        return {};
    }
    // Wall-clock fields straight from the instant; going through local time
    // would shift floating values that fall into a DST gap.
    const QString date = instant.date().toString(QStringLiteral("yyyyMMdd"));
    switch (instant.kind()) {
    case InstantKind::DateOnly:
        return date;
    case InstantKind::Utc:
        return date + QLatin1Char('T') + instant.time().toString(QStringLiteral("HHmmss")) + QLatin1Char('Z');
    case InstantKind::Floating:
    default:
        return date + QLatin1Char('T') + instant.time().toString(QStringLiteral("HHmmss"));
    }
}

std::optional<Duration> parseDuration(const QString &text, ParseError *error)
{
    const QString field = QStringLiteral("DURATION");
    int pos = 0;
    Duration result;
    if (pos < text.size() && (text.at(pos) == QLatin1Char('-') || text.at(pos) == QLatin1Char('+'))) {
        result.negative = text.at(pos) == QLatin1Char('-');
        ++pos;
    }
    if (pos >= text.size() || text.at(pos) != QLatin1Char('P')) {
        fail(error, field, text, QStringLiteral("missing 'P' designator"));
        return std::nullopt;
    }
    ++pos;

    qint64 weeks = 0;
    qint64 days = 0;
    qint64 hours = 0;
    qint64 minutes = 0;
    qint64 seconds = 0;
    bool hasDays = false;
    bool hasHours = false;
    bool hasMinutes = false;
    bool hasSeconds = false;
    bool tooLarge = false;

    if (readComponent(text, &pos, QLatin1Char('W'), &weeks, &tooLarge)) {
        hasDays = true;
    }
    if (readComponent(text, &pos, QLatin1Char('D'), &days, &tooLarge)) {
        hasDays = true;
    }
    if (pos < text.size() && text.at(pos) == QLatin1Char('T')) {
        ++pos;
        hasHours = readComponent(text, &pos, QLatin1Char('H'), &hours, &tooLarge);
        hasMinutes = readComponent(text, &pos, QLatin1Char('M'), &minutes, &tooLarge);
        hasSeconds = readComponent(text, &pos, QLatin1Char('S'), &seconds, &tooLarge);
        if (!hasHours && !hasMinutes && !hasSeconds && !tooLarge) {
            fail(error, field, text, QStringLiteral("'T' must be followed by hours, minutes or seconds"));
            return std::nullopt;
        }
    }
    if (tooLarge) {
        fail(error, field, text, QStringLiteral("value is too large"));
        return std::nullopt;
    }
    if (pos != text.size()) {
        fail(error, field, text, QStringLiteral("unexpected character at position %1").arg(pos));
        return std::nullopt;
    }
    if (!hasDays && !hasHours && !hasMinutes && !hasSeconds) {
        fail(error, field, text, QStringLiteral("no duration component"));
        return std::nullopt;
    }

    days += weeks * 7;
    if (hasSeconds) {
        result.unit = DurationUnit::Seconds;
        result.value = ((days * 24 + hours) * 60 + minutes) * 60 + seconds;
    } else if (hasMinutes) {
        result.unit = DurationUnit::Minutes;
        result.value = (days * 24 + hours) * 60 + minutes;
    } else if (hasHours) {
        result.unit = DurationUnit::Hours;
        result.value = days * 24 + hours;
    } else {
        result.unit = DurationUnit::Days;
        result.value = days;
    }
    return result;
}

QString formatDuration(qint64 value, DurationUnit unit)
{
    const QString sign = value < 0 ? QStringLiteral("-") : QString();
    const qint64 magnitude = value < 0 ? -value : value;
    switch (unit) {
    case DurationUnit::Days:
        return sign + QStringLiteral("P%1D").arg(magnitude);
    case DurationUnit::Hours:
        return sign + QStringLiteral("PT%1H").arg(magnitude);
    case DurationUnit::Seconds:
        return sign + QStringLiteral("PT%1S").arg(magnitude);
    case DurationUnit::Minutes:
    default:
        return sign + QStringLiteral("PT%1M").arg(magnitude);
    }
}

QString formatDuration(const Duration &duration)
{
    const QString text = formatDuration(duration.value, duration.unit);
    return duration.negative ? QStringLiteral("-") + text : text;
}

} // namespace core
} // namespace calmerge
