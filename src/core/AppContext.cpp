#include "calmerge/core/AppContext.hpp"

#include <QSettings>

#include "calmerge/data/InMemoryCalendarRepository.hpp"
#include "calmerge/service/CalendarService.hpp"

namespace calmerge {
namespace core {

AppContext::AppContext()
    : AppContext(EngineSettings::load(QSettings()))
{
}

AppContext::AppContext(const EngineSettings &settings)
    : m_settings(settings)
    , m_repository(std::make_unique<data::InMemoryCalendarRepository>())
    , m_service(std::make_unique<service::CalendarService>(*m_repository, m_settings))
{
}

AppContext::~AppContext() = default;

data::CalendarRepository &AppContext::calendarRepository()
{
    return *m_repository;
}

service::CalendarService &AppContext::calendarService()
{
    return *m_service;
}

const EngineSettings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace calmerge
