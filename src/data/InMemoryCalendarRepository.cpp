#include "calmerge/data/InMemoryCalendarRepository.hpp"

namespace calmerge {
namespace data {

InMemoryCalendarRepository::InMemoryCalendarRepository() = default;
InMemoryCalendarRepository::~InMemoryCalendarRepository() = default;

std::vector<Calendar> InMemoryCalendarRepository::fetchCalendars() const
{
    std::vector<Calendar> calendars;
    calendars.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        calendars.push_back(m_calendars.value(id));
    }
    return calendars;
}

std::optional<Calendar> InMemoryCalendarRepository::findById(const QUuid &id) const
{
    if (m_calendars.contains(id)) {
        return m_calendars.value(id);
    }
    return std::nullopt;
}

Calendar InMemoryCalendarRepository::addCalendar(Calendar calendar)
{
    if (calendar.id.isNull() || m_calendars.contains(calendar.id)) {
        calendar.id = QUuid::createUuid();
    }
    m_calendars.insert(calendar.id, calendar);
    m_order.append(calendar.id);
    return calendar;
}

bool InMemoryCalendarRepository::updateCalendar(const Calendar &calendar)
{
    if (!m_calendars.contains(calendar.id)) {
        return false;
    }
    m_calendars.insert(calendar.id, calendar);
    return true;
}

bool InMemoryCalendarRepository::removeCalendar(const QUuid &id)
{
    m_order.removeAll(id);
    return m_calendars.remove(id) > 0;
}

} // namespace data
} // namespace calmerge
