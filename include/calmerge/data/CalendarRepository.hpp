#pragma once

#include <optional>
#include <vector>

#include "calmerge/data/Calendar.hpp"

namespace calmerge {
namespace data {

class CalendarRepository
{
public:
    virtual ~CalendarRepository() = default;

    virtual std::vector<Calendar> fetchCalendars() const = 0;
    virtual std::optional<Calendar> findById(const QUuid &id) const = 0;
    virtual Calendar addCalendar(Calendar calendar) = 0;
    virtual bool updateCalendar(const Calendar &calendar) = 0;
    virtual bool removeCalendar(const QUuid &id) = 0;
};

} // namespace data
} // namespace calmerge
