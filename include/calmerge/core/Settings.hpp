#pragma once

#include <QString>

class QSettings;

namespace calmerge {
namespace core {

struct EngineSettings
{
    bool removeDuplicates = true;
    bool skipTransparentConflicts = false;
    bool skipCancelledConflicts = false;
    QString productId; // empty selects the built-in PRODID
    QString defaultBundleName = QStringLiteral("Shared calendars");
    int maxCalendarsPerBundle = 15;

    static EngineSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace calmerge
