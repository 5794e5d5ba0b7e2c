#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>
#include <vector>

#include "calmerge/core/Errors.hpp"
#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace data {

struct ContentLine;

struct ImportResult
{
    QString calendarName;
    QString calendarColor;
    QUrl calendarSource;
    std::vector<CalendarEvent> events;
    int skippedEvents = 0;
    int skippedFields = 0;
    std::vector<core::ParseError> parseErrors;
    std::vector<core::ValidationError> validationErrors;
    QStringList warnings;
};

class IcsReader
{
public:
    ImportResult read(const QString &text) const;
    ImportResult readFile(const QString &filePath, bool *ok = nullptr) const;
};

} // namespace data
} // namespace calmerge
