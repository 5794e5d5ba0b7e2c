#pragma once

#include <QString>
#include <optional>

#include "calmerge/core/Duration.hpp"
#include "calmerge/core/Errors.hpp"
#include "calmerge/core/Instant.hpp"

namespace calmerge {
namespace core {

std::optional<Instant> parseInstant(const QString &text, ParseError *error = nullptr);
QString formatInstant(const Instant &instant);

std::optional<Duration> parseDuration(const QString &text, ParseError *error = nullptr);
QString formatDuration(qint64 value, DurationUnit unit);
// Same as above, with a leading '-' for negative durations.
QString formatDuration(const Duration &duration);

} // namespace core
} // namespace calmerge
