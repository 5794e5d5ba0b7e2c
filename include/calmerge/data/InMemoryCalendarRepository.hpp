#pragma once

#include <QHash>
#include <QList>

#include "calmerge/data/CalendarRepository.hpp"

namespace calmerge {
namespace data {

class InMemoryCalendarRepository : public CalendarRepository
{
public:
    InMemoryCalendarRepository();
    ~InMemoryCalendarRepository() override;

    std::vector<Calendar> fetchCalendars() const override;
    std::optional<Calendar> findById(const QUuid &id) const override;
    Calendar addCalendar(Calendar calendar) override;
    bool updateCalendar(const Calendar &calendar) override;
    bool removeCalendar(const QUuid &id) override;

private:
    QHash<QUuid, Calendar> m_calendars;
    QList<QUuid> m_order;
};

} // namespace data
} // namespace calmerge
