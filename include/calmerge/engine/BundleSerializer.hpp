#pragma once

#include <QDateTime>
#include <QString>
#include <vector>

#include "calmerge/data/Calendar.hpp"

namespace calmerge {
namespace engine {

constexpr const char *DefaultProductId = "-//Calmerge//Calmerge//EN";

struct BundleOptions
{
    QString name;                                  // X-WR-CALNAME, omitted when empty
    QString productId = QLatin1String(DefaultProductId);
    QDateTime generatedAt;                         // DTSTAMP; current time when invalid
};

// Events in calendar order; optional properties are written only when set.
QString serializeBundle(const std::vector<data::Calendar> &calendars, bool removeDuplicates,
                        const BundleOptions &options = BundleOptions());

// One calendar, every event, with the calendar's own name and color.
QString writeCalendar(const data::Calendar &calendar, const BundleOptions &options = BundleOptions());

} // namespace engine
} // namespace calmerge
