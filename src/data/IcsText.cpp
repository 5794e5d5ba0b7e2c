#include "calmerge/data/IcsText.hpp"

namespace calmerge {
namespace data {

namespace {
constexpr int MaxLineOctets = 75;

int utf8Length(uint codePoint)
{
    if (codePoint < 0x80) {
        return 1;
    }
    if (codePoint < 0x800) {
        return 2;
    }
    if (codePoint < 0x10000) {
        return 3;
    }
    return 4;
}

QString stripQuotes(const QString &value)
{
    if (value.size() >= 2 && value.startsWith(QLatin1Char('"')) && value.endsWith(QLatin1Char('"'))) {
        return value.mid(1, value.size() - 2);
    }
    return value;
}
} // namespace

QString ContentLine::parameter(const QString &parameterName) const
{
    const QString key = parameterName.toUpper();
    for (const auto &param : parameters) {
        if (param.first == key) {
            return param.second;
        }
    }
    return {};
}

bool ContentLine::hasParameter(const QString &parameterName) const
{
    const QString key = parameterName.toUpper();
    for (const auto &param : parameters) {
        if (param.first == key) {
            return true;
        }
    }
    return false;
}

std::optional<ContentLine> parseContentLine(const QString &line)
{
    // The value starts at the first colon outside a quoted parameter value.
    bool quoted = false;
    int colonIndex = -1;
    QList<int> separators;
    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line.at(i);
        if (ch == QLatin1Char('"')) {
            quoted = !quoted;
        } else if (!quoted && ch == QLatin1Char(';')) {
            separators.append(i);
        } else if (!quoted && ch == QLatin1Char(':')) {
            colonIndex = i;
            break;
        }
    }
    if (colonIndex <= 0) {
        return std::nullopt;
    }

    ContentLine result;
    const int nameEnd = separators.isEmpty() ? colonIndex : separators.first();
    result.name = line.left(nameEnd).trimmed().toUpper();
    if (result.name.isEmpty()) {
        return std::nullopt;
    }
    separators.append(colonIndex);
    for (int i = 0; i + 1 < separators.size(); ++i) {
        const QString param = line.mid(separators.at(i) + 1, separators.at(i + 1) - separators.at(i) - 1);
        const int equals = param.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            continue;
        }
        result.parameters.append(qMakePair(param.left(equals).trimmed().toUpper(), stripQuotes(param.mid(equals + 1))));
    }
    result.value = line.mid(colonIndex + 1);
    return result;
}

QStringList unfoldLines(const QString &text)
{
    QStringList lines;
    const QStringList physical = text.split(QLatin1Char('\n'));
    for (QString line : physical) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (!line.isEmpty() && (line.startsWith(QLatin1Char(' ')) || line.startsWith(QLatin1Char('\t')))) {
            if (!lines.isEmpty()) {
                lines.last() += line.mid(1);
            }
            continue;
        }
        if (!line.isEmpty()) {
            lines.append(line);
        }
    }
    return lines;
}

QString foldLine(const QString &line)
{
    QString folded;
    folded.reserve(line.size() + line.size() / 60 * 3 + 2);
    int octets = 0;
    int i = 0;
    while (i < line.size()) {
        int units = 1;
        uint codePoint = line.at(i).unicode();
        if (line.at(i).isHighSurrogate() && i + 1 < line.size() && line.at(i + 1).isLowSurrogate()) {
            codePoint = QChar::surrogateToUcs4(line.at(i), line.at(i + 1));
            units = 2;
        }
        const int length = utf8Length(codePoint);
        if (octets + length > MaxLineOctets) {
            folded += QStringLiteral("\r\n ");
            octets = 1;
        }
        folded += line.mid(i, units);
        octets += length;
        i += units;
    }
    folded += QStringLiteral("\r\n");
    return folded;
}

QString escapeText(const QString &text)
{
    QString escaped;
    escaped.reserve(text.size());
    for (const QChar ch : text) {
        switch (ch.unicode()) {
        case '\\':
            escaped += QStringLiteral("\\\\");
            break;
        case ';':
            escaped += QStringLiteral("\\;");
            break;
        case ',':
            escaped += QStringLiteral("\\,");
            break;
        case '\n':
            escaped += QStringLiteral("\\n");
            break;
        case '\r':
            break;
        default:
            escaped += ch;
        }
    }
    return escaped;
}

QString unescapeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != QLatin1Char('\\') || i + 1 >= text.size()) {
            decoded += ch;
            continue;
        }
        const QChar next = text.at(i + 1);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else if (next == QLatin1Char(',') || next == QLatin1Char(';') || next == QLatin1Char('\\')) {
            decoded += next;
        } else {
            decoded += ch;
            decoded += next;
        }
        ++i;
    }
    return decoded;
}

QStringList splitTextList(const QString &value)
{
    QStringList items;
    QString current;
    for (int i = 0; i < value.size(); ++i) {
        const QChar ch = value.at(i);
        if (ch == QLatin1Char('\\') && i + 1 < value.size()) {
            current += ch;
            current += value.at(++i);
            continue;
        }
        if (ch == QLatin1Char(',')) {
            items.append(current);
            current.clear();
            continue;
        }
        current += ch;
    }
    items.append(current);

    QStringList cleaned;
    for (const QString &item : items) {
        const QString text = unescapeText(item).trimmed();
        if (!text.isEmpty()) {
            cleaned << text;
        }
    }
    return cleaned;
}

QString joinTextList(const QStringList &values)
{
    QStringList escaped;
    escaped.reserve(values.size());
    for (const QString &value : values) {
        escaped << escapeText(value);
    }
    return escaped.join(QLatin1Char(','));
}

} // namespace data
} // namespace calmerge
