#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <memory>

#include "version.h"

#include "chorewheel/core/AppContext.hpp"
#include "chorewheel/core/AppSettings.hpp"
#include "chorewheel/core/Logging.hpp"
#include "chorewheel/core/TaskScheduler.hpp"
#include "chorewheel/core/TaskTriggerEngine.hpp"
#include "chorewheel/ui/MainWindow.hpp"

namespace {

bool runsWithoutWindow(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i) {
        const QByteArray arg(argv[i]);
        if (arg == "--headless" || arg == "--advance" || arg == "--dump" || arg.startsWith("--dump=")
            || arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
            return true;
        }
    }
    return false;
}

void printAssignments(const std::vector<chorewheel::core::AssignmentPreview> &assignments)
{
    QTextStream out(stdout);
    for (const auto &assignment : assignments) {
        out << assignment.date.toString(QStringLiteral("yyyy-MM-dd ddd")) << "  "
            << assignment.time.toString(QStringLiteral("HH:mm")) << "  " << assignment.person << "  "
            << assignment.action << '\n';
    }
    out.flush();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("ChoreWheel"));
    QCoreApplication::setApplicationName(QStringLiteral("ChoreWheel"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kChoreWheelVersion));

    std::unique_ptr<QCoreApplication> app;
    if (runsWithoutWindow(argc, argv)) {
        app = std::make_unique<QCoreApplication>(argc, argv);
    } else {
        app = std::make_unique<QApplication>(argc, argv);
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Rotating household chores with timed reminders."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QObject::tr("Read settings from an INI file."),
                                          QStringLiteral("file"));
    const QCommandLineOption dataDirOption(QStringLiteral("data-dir"), QObject::tr("Directory holding the schedule and state files."),
                                           QStringLiteral("dir"));
    const QCommandLineOption advanceOption(QStringLiteral("advance"), QObject::tr("Advance every rotation by one slot and exit."));
    const QCommandLineOption dumpOption(QStringLiteral("dump"), QObject::tr("Print assignments for the next N days and exit."),
                                        QStringLiteral("days"));
    const QCommandLineOption injectOption(QStringLiteral("inject"),
                                          QObject::tr("Inject a test task, e.g. 30:Alice or 10:joke."),
                                          QStringLiteral("seconds:who"));
    const QCommandLineOption headlessOption(QStringLiteral("headless"), QObject::tr("Run without a window."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QObject::tr("Enable debug logging."));
    parser.addOptions({ configOption, dataDirOption, advanceOption, dumpOption, injectOption, headlessOption,
                        verboseOption });
    parser.process(*app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("chorewheel.*.debug=true"));
    }

    std::unique_ptr<QSettings> settingsStore;
    if (parser.isSet(configOption)) {
        settingsStore = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        settingsStore = std::make_unique<QSettings>();
    }
    auto settings = chorewheel::core::AppSettings::load(*settingsStore);
    if (parser.isSet(dataDirOption)) {
        settings.dataDir = parser.value(dataDirOption);
    }

    chorewheel::core::AppContext context(settings);
    auto &scheduler = context.scheduler();
    if (!scheduler.initialize()) {
        qCCritical(lcApp) << "Rotation state could not be saved to" << settings.rotationStatePath();
    }

    const bool oneShot = parser.isSet(advanceOption) || parser.isSet(dumpOption);
    if (parser.isSet(advanceOption)) {
        if (!scheduler.advanceAllRotations()) {
            qCCritical(lcApp) << "Advancing rotations failed to persist";
            return 1;
        }
        qCInfo(lcApp) << "Rotations advanced";
    }
    if (parser.isSet(dumpOption)) {
        bool ok = false;
        const int days = parser.value(dumpOption).toInt(&ok);
        if (!ok || days <= 0) {
            qCCritical(lcApp) << "Invalid day count" << parser.value(dumpOption);
            return 1;
        }
        printAssignments(scheduler.upcomingAssignments(days));
    }
    if (oneShot) {
        return 0;
    }

    if (parser.isSet(injectOption)) {
        const QString value = parser.value(injectOption);
        const int separator = value.indexOf(':');
        bool ok = false;
        const int seconds = separator > 0 ? value.left(separator).toInt(&ok) : 0;
        if (!ok || !scheduler.injectTask(seconds, value.mid(separator + 1))) {
            qCCritical(lcApp) << "Invalid --inject value" << value;
            return 1;
        }
    }

    QObject::connect(app.get(), &QCoreApplication::aboutToQuit, &scheduler, &chorewheel::core::TaskScheduler::stop);

    std::unique_ptr<chorewheel::ui::MainWindow> mainWindow;
    if (parser.isSet(headlessOption)) {
        QObject::connect(&scheduler.engine(), &chorewheel::core::TaskTriggerEngine::taskFired, &scheduler,
                         [](const chorewheel::core::TaskInstance &, const QString &displayText, const QString &speechText) {
                             qCInfo(lcApp).noquote() << "ALERT" << displayText << "|" << speechText;
                         });
        QObject::connect(&scheduler.engine(), &chorewheel::core::TaskTriggerEngine::nextTaskChanged, &scheduler,
                         [](const QString &summary) { qCInfo(lcApp).noquote() << "Next:" << summary; });
        QObject::connect(&scheduler.engine(), &chorewheel::core::TaskTriggerEngine::lastTaskChanged, &scheduler,
                         [](const QString &summary) { qCInfo(lcApp).noquote() << "Last:" << summary; });
    } else {
        mainWindow = std::make_unique<chorewheel::ui::MainWindow>(scheduler);
        mainWindow->setWindowTitle(QObject::tr("ChoreWheel %1").arg(QString::fromLatin1(kChoreWheelVersion)));
        mainWindow->show();
    }

    scheduler.start();
    const int result = app->exec();
    scheduler.stop();
    return result;
}
