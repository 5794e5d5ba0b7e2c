#pragma once

#include <QString>
#include <QUrl>
#include <QUuid>
#include <vector>

#include "calmerge/data/Event.hpp"

namespace calmerge {
namespace data {

struct Calendar
{
    QUuid id = QUuid::createUuid();
    QString name;
    QString color;
    QUrl sourceUrl; // SOURCE of the imported document, or the file it came from
    std::vector<CalendarEvent> events;
};

} // namespace data
} // namespace calmerge
