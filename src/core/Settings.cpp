#include "calmerge/core/Settings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace calmerge {
namespace core {

namespace {
const QString kRemoveDuplicatesKey = QStringLiteral("merge/removeDuplicates");
const QString kSkipTransparentKey = QStringLiteral("conflicts/skipTransparent");
const QString kSkipCancelledKey = QStringLiteral("conflicts/skipCancelled");
const QString kProductIdKey = QStringLiteral("bundle/productId");
const QString kBundleNameKey = QStringLiteral("bundle/defaultName");
const QString kMaxCalendarsKey = QStringLiteral("bundle/maxCalendars");

constexpr int kBundleCalendarLimit = 15;
} // namespace

EngineSettings EngineSettings::load(const QSettings &settings)
{
    EngineSettings result;
    result.removeDuplicates = settings.value(kRemoveDuplicatesKey, true).toBool();
    result.skipTransparentConflicts = settings.value(kSkipTransparentKey, false).toBool();
    result.skipCancelledConflicts = settings.value(kSkipCancelledKey, false).toBool();
    result.productId = settings.value(kProductIdKey).toString().trimmed();
    result.defaultBundleName = settings.value(kBundleNameKey, QStringLiteral("Shared calendars")).toString();
    const int storedMax = settings.value(kMaxCalendarsKey, kBundleCalendarLimit).toInt();
    result.maxCalendarsPerBundle = qBound(1, storedMax, kBundleCalendarLimit);
    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.setValue(kRemoveDuplicatesKey, removeDuplicates);
    settings.setValue(kSkipTransparentKey, skipTransparentConflicts);
    settings.setValue(kSkipCancelledKey, skipCancelledConflicts);
    if (productId.isEmpty()) {
        settings.remove(kProductIdKey);
    } else {
        settings.setValue(kProductIdKey, productId);
    }
    settings.setValue(kBundleNameKey, defaultBundleName);
    settings.setValue(kMaxCalendarsKey, maxCalendarsPerBundle);
}

} // namespace core
} // namespace calmerge
