#pragma once

#include <memory>

#include "calmerge/core/Settings.hpp"

namespace calmerge {
namespace data {
class CalendarRepository;
}

namespace service {
class CalendarService;
}

namespace core {

class AppContext
{
public:
    AppContext();
    explicit AppContext(const EngineSettings &settings);
    ~AppContext();

    data::CalendarRepository &calendarRepository();
    service::CalendarService &calendarService();
    const EngineSettings &settings() const;

private:
    EngineSettings m_settings;
    std::unique_ptr<data::CalendarRepository> m_repository;
    std::unique_ptr<service::CalendarService> m_service;
};

} // namespace core
} // namespace calmerge
