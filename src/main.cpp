#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QUrl>
#include <optional>

#include "version.h"

#include "calmerge/core/AppContext.hpp"
#include "calmerge/core/TemporalCodec.hpp"
#include "calmerge/data/CalendarRepository.hpp"
#include "calmerge/data/IcsReader.hpp"
#include "calmerge/engine/BundleSerializer.hpp"
#include "calmerge/service/CalendarService.hpp"

using namespace calmerge;

namespace {

enum ExitCode
{
    Success = 0,
    UsageError = 1,
    UnreadableInput = 2,
};

QTextStream &errorStream()
{
    static QTextStream stream(stderr);
    stream.setCodec("UTF-8");
    return stream;
}

bool writeOutput(const QString &text, const QString &outputPath)
{
    if (outputPath.isEmpty()) {
        QTextStream out(stdout);
        out.setCodec("UTF-8");
        out << text;
        out.flush();
        return true;
    }
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        errorStream() << "cannot write " << outputPath << ": " << file.errorString() << '\n';
        return false;
    }
    file.write(text.toUtf8());
    if (!file.commit()) {
        errorStream() << "cannot write " << outputPath << ": " << file.errorString() << '\n';
        return false;
    }
    return true;
}

QString describe(const data::CalendarEvent &event)
{
    return QStringLiteral("%1 [%2 - %3]").arg(event.title, core::formatInstant(event.start), core::formatInstant(event.end));
}

// Each file becomes one calendar in the repository, named after the file
// unless it carries X-WR-CALNAME, with the file as its source unless it
// declares SOURCE.
std::optional<QList<QUuid>> loadCalendars(core::AppContext &context, const QStringList &files,
                                          QList<service::ImportReport> *reports = nullptr)
{
    QList<QUuid> ids;
    for (const auto &path : files) {
        bool readable = false;
        const data::ImportResult parsed = data::IcsReader().readFile(path, &readable);
        if (!readable) {
            errorStream() << "cannot read " << path << '\n';
            return std::nullopt;
        }
        data::Calendar calendar;
        const auto stored = context.calendarRepository().addCalendar(calendar);
        const auto outcome = context.calendarService().importEvents(stored.id, parsed, false);
        if (const auto error = std::get_if<core::PreconditionError>(&outcome)) {
            errorStream() << path << ": " << error->message << '\n';
            return std::nullopt;
        }
        auto loaded = context.calendarRepository().findById(stored.id);
        if (loaded && (loaded->name.isEmpty() || loaded->sourceUrl.isEmpty())) {
            const QFileInfo info(path);
            if (loaded->name.isEmpty()) {
                loaded->name = info.completeBaseName();
            }
            if (loaded->sourceUrl.isEmpty()) {
                loaded->sourceUrl = QUrl::fromLocalFile(info.absoluteFilePath());
            }
            if (!context.calendarRepository().updateCalendar(*loaded)) {
                errorStream() << path << ": calendar vanished while loading\n";
                return std::nullopt;
            }
        }
        if (reports) {
            reports->append(std::get<service::ImportReport>(outcome));
        }
        ids.append(stored.id);
    }
    return ids;
}

int reportPrecondition(const core::PreconditionError &error)
{
    errorStream() << "error: " << error.message << '\n';
    return UsageError;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Calmerge"));
    QCoreApplication::setApplicationName(QStringLiteral("calmerge"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCalmergeVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Merge, deduplicate, check and bundle iCalendar files."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("merge, dedup, conflicts, bundle or check."));
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("ICS files to read."), QStringLiteral("files..."));

    const QCommandLineOption nameOption(QStringList() << QStringLiteral("n") << QStringLiteral("name"),
                                        QStringLiteral("Name of the merged calendar or bundle."), QStringLiteral("name"));
    const QCommandLineOption dedupOption(QStringLiteral("dedup"), QStringLiteral("Drop duplicate events."));
    const QCommandLineOption keepOption(QStringLiteral("keep-duplicates"), QStringLiteral("Keep duplicate events."));
    const QCommandLineOption outputOption(QStringList() << QStringLiteral("o") << QStringLiteral("output"),
                                          QStringLiteral("Write to file instead of stdout."), QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringList() << QStringLiteral("v") << QStringLiteral("verbose"),
                                           QStringLiteral("Print debug output."));
    parser.addOption(nameOption);
    parser.addOption(dedupOption);
    parser.addOption(keepOption);
    parser.addOption(outputOption);
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("calmerge.*.debug=true"));
    }

    QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(UsageError);
    }
    const QString command = arguments.takeFirst();
    const QStringList commands = {QStringLiteral("merge"), QStringLiteral("dedup"), QStringLiteral("conflicts"),
                                  QStringLiteral("bundle"), QStringLiteral("check")};
    if (!commands.contains(command)) {
        errorStream() << "unknown command: " << command << '\n';
        return UsageError;
    }
    if (arguments.isEmpty()) {
        errorStream() << command << ": no input files\n";
        return UsageError;
    }

    core::AppContext context;
    bool removeDuplicates = context.settings().removeDuplicates;
    if (parser.isSet(dedupOption)) {
        removeDuplicates = true;
    } else if (parser.isSet(keepOption)) {
        removeDuplicates = false;
    }
    const QString outputPath = parser.value(outputOption);
    auto &calendarService = context.calendarService();

    if (command == QLatin1String("check")) {
        QList<service::ImportReport> reports;
        const auto ids = loadCalendars(context, arguments, &reports);
        if (!ids) {
            return UnreadableInput;
        }
        QString text;
        QTextStream out(&text);
        for (int i = 0; i < reports.size(); ++i) {
            const auto &report = reports.at(i);
            out << arguments.at(i) << ": " << report.importedEvents << " events, " << report.skippedEvents
                << " skipped events, " << report.skippedFields << " skipped fields\n";
            for (const auto &warning : report.warnings) {
                out << "  " << warning << '\n';
            }
        }
        out.flush();
        return writeOutput(text, outputPath) ? Success : UnreadableInput;
    }

    const auto ids = loadCalendars(context, arguments);
    if (!ids) {
        return UnreadableInput;
    }

    if (command == QLatin1String("merge")) {
        const auto outcome = calendarService.merge(*ids, parser.value(nameOption), removeDuplicates);
        if (const auto error = std::get_if<core::PreconditionError>(&outcome)) {
            return reportPrecondition(*error);
        }
        const auto &result = std::get<engine::MergeResult>(outcome);
        engine::BundleOptions options;
        if (!context.settings().productId.isEmpty()) {
            options.productId = context.settings().productId;
        }
        errorStream() << "merged " << result.mergedEvents << " events, removed " << result.removedDuplicates
                      << " duplicates\n";
        return writeOutput(engine::writeCalendar(result.calendar, options), outputPath) ? Success : UnreadableInput;
    }

    if (command == QLatin1String("dedup")) {
        if (ids->size() != 1) {
            errorStream() << "dedup takes exactly one file\n";
            return UsageError;
        }
        const auto outcome = calendarService.previewDuplicates(ids->first());
        if (const auto error = std::get_if<core::PreconditionError>(&outcome)) {
            return reportPrecondition(*error);
        }
        const auto &partition = std::get<engine::DuplicatePartition>(outcome);
        QString text;
        QTextStream out(&text);
        out << partition.removed.size() << " duplicates, " << partition.kept.size() << " events kept\n";
        for (const auto &event : partition.removed) {
            out << "  " << describe(event) << '\n';
        }
        out.flush();
        return writeOutput(text, outputPath) ? Success : UnreadableInput;
    }

    if (command == QLatin1String("conflicts")) {
        const auto outcome = calendarService.findConflicts(*ids);
        if (const auto error = std::get_if<core::PreconditionError>(&outcome)) {
            return reportPrecondition(*error);
        }
        const auto &conflicts = std::get<std::vector<engine::EventConflict>>(outcome);
        QString text;
        QTextStream out(&text);
        out << conflicts.size() << " conflicts\n";
        for (const auto &conflict : conflicts) {
            out << "  " << describe(conflict.first) << " overlaps " << describe(conflict.second) << '\n';
        }
        out.flush();
        return writeOutput(text, outputPath) ? Success : UnreadableInput;
    }

    if (command == QLatin1String("bundle")) {
        const auto outcome = calendarService.createBundle(*ids, removeDuplicates, parser.value(nameOption));
        if (const auto error = std::get_if<core::PreconditionError>(&outcome)) {
            return reportPrecondition(*error);
        }
        return writeOutput(std::get<QString>(outcome), outputPath) ? Success : UnreadableInput;
    }

    return UsageError;
}
