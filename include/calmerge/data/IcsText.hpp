#pragma once

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <optional>

namespace calmerge {
namespace data {

struct ContentLine
{
    QString name;
    QList<QPair<QString, QString>> parameters;
    QString value;

    QString parameter(const QString &parameterName) const;
    bool hasParameter(const QString &parameterName) const;
};

std::optional<ContentLine> parseContentLine(const QString &line);

// Joins folded continuation lines; accepts LF and CRLF endings.
QStringList unfoldLines(const QString &text);
// Splits a logical line into CRLF-terminated physical lines of at most 75
// octets, never inside a UTF-8 sequence.
QString foldLine(const QString &line);

QString escapeText(const QString &text);
QString unescapeText(const QString &text);
// Splits a comma-separated TEXT list, honouring "\," escapes.
QStringList splitTextList(const QString &value);
QString joinTextList(const QStringList &values);

} // namespace data
} // namespace calmerge
